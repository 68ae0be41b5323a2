#pragma once

#include <core/findings.hpp>
#include <string>

namespace uuid_autopsy::render {

/**
 * @brief Renders findings as the annotated box-drawing report.
 *
 * Layout:
 * @code
 * <summary>
 *
 * ┌┬┬┬┬┬┬┬────────────────────┬┬┬┬┬┬┬┐
 * ││││││││ ┌┬┬┬───────────┬┬┬┐││││││││
 * ││││││││ ││││  ┌┬┬── <timestamp> (<time description>)*
 * ││││││││ ││││  │││
 * <canonical uuid>
 *               │    ││││
 *               │    └└└└── = <clock_seq bits>
 *               │             <clock sequence lines>
 *               └─────── = version <n> (<version description>)
 *
 * * <timestamp notes>
 * @endcode
 *
 * @param result Findings for one UUID
 * @return Multi-line report ending in a newline
 */
[[nodiscard]] auto render_text(const core::findings &result) -> std::string;

}// namespace uuid_autopsy::render
