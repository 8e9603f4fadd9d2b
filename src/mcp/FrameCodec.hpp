// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace webchat
{

/// @brief Reassembles newline-delimited JSON messages from raw byte chunks.
///
/// Chunks may split a message at any byte or carry several messages at once.
/// Bytes after the last newline are held back and prepended to the next feed().
/// Lines that are not valid JSON (providers sometimes print diagnostics to the
/// same stream) are logged and dropped.
///
/// One codec belongs to exactly one connection instance.
class FrameCodec
{
  public:
    /// @brief Consumes a chunk and returns every message it completes.
    /// @param chunk Raw bytes as read from the transport.
    /// @return Decoded messages in stream order; empty if no line was completed.
    [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<nlohmann::json>;

    /// @brief Discards any buffered partial line.
    void reset();

    /// @brief Number of bytes held back waiting for a newline.
    [[nodiscard]] auto bufferedSize() const noexcept -> size_t { return _buffer.size(); }

    /// @brief Number of lines dropped because they were not valid JSON.
    [[nodiscard]] auto droppedLines() const noexcept -> size_t { return _droppedLines; }

  private:
    std::string _buffer;
    size_t _droppedLines = 0;
};

} // namespace webchat
