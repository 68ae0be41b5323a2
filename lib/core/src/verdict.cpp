#include <core/overload.hpp>
#include <core/verdict.hpp>

namespace uuid_autopsy::core {

auto summary_of(const verdict &outcome) -> std::string_view
{
  return std::visit(overload{
                      [](const unrecognized &) -> std::string_view {
                        return "This doesn't seem like a UUID generated according to RFC 4122.";
                      },
                      [](const definitely_invalid &) -> std::string_view {
                        return "This is DEFINITELY NOT a UUID generated according to RFC 4122.";
                      },
                      [](const nil_uuid &) -> std::string_view {
                        return "This UUID is specifically defined by RFC 4122 as the \"nil\" UUID.";
                      },
                      [](const microsoft_known_value &) -> std::string_view {
                        return "This seems like a UUID from Microsoft.";
                      },
                      [](const valid &accepted) -> std::string_view {
                        switch (accepted.version) {
                        case 1:
                          return "This seems like a UUID generated according to RFC 4122 or DCE.";
                        case 2:
                          return "This seems like a UUID generated according to DCE Security.";
                        default:
                          return "This seems like a UUID generated according to RFC 4122.";
                        }
                      },
                    },
    outcome);
}

auto name_of(const verdict &outcome) -> std::string_view
{
  return std::visit(overload{
                      [](const unrecognized &) -> std::string_view { return "unrecognized"; },
                      [](const definitely_invalid &) -> std::string_view { return "definitely_invalid"; },
                      [](const nil_uuid &) -> std::string_view { return "nil_uuid"; },
                      [](const microsoft_known_value &) -> std::string_view { return "microsoft_known_value"; },
                      [](const valid &) -> std::string_view { return "valid"; },
                    },
    outcome);
}

}// namespace uuid_autopsy::core
