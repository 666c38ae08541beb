#pragma once

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "collaborators.hpp"
#include "ring_buffer.hpp"

namespace srvkeeper {

// Follows the server console log by byte offset. The constructor loads the existing tail into the
// recent-line buffer and positions at end of file, so ReadNewLines only yields output written after
// the reader was created. A shrinking file or a new inode restarts from the beginning.
class LogTailReader : public LogSource {
  public:
    LogTailReader(std::filesystem::path path, std::size_t tail_lines);

    std::vector<std::string> ReadNewLines() override;
    std::vector<std::string> RecentTail(std::size_t max_lines) const override;

    std::uint64_t Offset() const { return offset_; }

  private:
    void load_initial_tail();
    void remember(const std::string &line);

    std::filesystem::path path_;
    RingBuffer<std::string> recent_;
    std::uint64_t offset_ = 0;
    ino_t inode_ = 0;
    std::string partial_;
};

}  // namespace srvkeeper
