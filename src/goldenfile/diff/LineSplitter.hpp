#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace GF::Diff {

/**
 * Splits a buffer into lines with the terminators ("\n" and a preceding "\r") removed.
 *
 * - An empty buffer yields no lines.
 * - A non-empty buffer that does not end in '\n' gets one extra empty entry appended,
 *   marking the missing final newline. The marker is positional and is not a real line.
 * - Bytes are passed through verbatim; no encoding validation happens here.
 */
[[nodiscard]] auto splitLines(std::string_view data) -> std::vector<std::string>;

} // namespace GF::Diff
