// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mcpdesk
{

/// @brief Splits a stream of text chunks into newline-delimited JSON messages.
///
/// The trailing fragment of each chunk is retained until a later chunk completes it,
/// so the produced message sequence does not depend on where chunk boundaries fall.
/// Blank lines are ignored; malformed lines are logged and dropped.
class LineFramer
{
  public:
    /// @brief Appends a chunk and returns every message completed by it, in order.
    [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<nlohmann::json>;

    /// @brief Returns the number of buffered bytes not yet terminated by a newline.
    [[nodiscard]] auto pendingBytes() const -> std::size_t { return _buffer.size(); }

    /// @brief Returns the number of lines dropped because they were not valid JSON.
    [[nodiscard]] auto droppedLines() const -> std::size_t { return _dropped; }

    /// @brief Discards any buffered partial line.
    void clear() { _buffer.clear(); }

  private:
    std::string _buffer;
    std::size_t _dropped = 0;
};

} // namespace mcpdesk
