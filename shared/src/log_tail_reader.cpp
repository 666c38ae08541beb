#include "log_tail_reader.hpp"

#include <sys/stat.h>

#include <fstream>

namespace srvkeeper {

namespace {

bool stat_file(const std::filesystem::path &path, std::uint64_t &size, ino_t &inode) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    size = static_cast<std::uint64_t>(st.st_size);
    inode = st.st_ino;
    return true;
}

std::string strip_carriage_return(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

}  // namespace

LogTailReader::LogTailReader(std::filesystem::path path, std::size_t tail_lines)
    : path_(std::move(path)), recent_(tail_lines) {
    load_initial_tail();
}

void LogTailReader::remember(const std::string &line) { recent_.Push(line); }

void LogTailReader::load_initial_tail() {
    std::uint64_t size = 0;
    if (!stat_file(path_, size, inode_)) {
        return;
    }
    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }
    std::string line;
    std::uint64_t consumed = 0;
    while (consumed < size && std::getline(in, line)) {
        if (in.eof()) {
            // Unterminated last line: leave it for ReadNewLines once the newline arrives.
            partial_ = line;
            consumed += line.size();
            break;
        }
        consumed += line.size() + 1;
        remember(strip_carriage_return(std::move(line)));
    }
    offset_ = consumed;
}

std::vector<std::string> LogTailReader::ReadNewLines() {
    std::vector<std::string> lines;
    std::uint64_t size = 0;
    ino_t inode = 0;
    if (!stat_file(path_, size, inode)) {
        return lines;
    }
    if (inode != inode_ || size < offset_) {
        inode_ = inode;
        offset_ = 0;
        partial_.clear();
    }
    if (size == offset_) {
        return lines;
    }

    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        return lines;
    }
    in.seekg(static_cast<std::streamoff>(offset_));
    std::string chunk(static_cast<std::size_t>(size - offset_), '\0');
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    chunk.resize(static_cast<std::size_t>(in.gcount()));
    offset_ += chunk.size();

    std::size_t start = 0;
    while (true) {
        auto newline = chunk.find('\n', start);
        if (newline == std::string::npos) {
            partial_.append(chunk, start, std::string::npos);
            break;
        }
        partial_.append(chunk, start, newline - start);
        std::string line = strip_carriage_return(std::move(partial_));
        partial_.clear();
        remember(line);
        lines.push_back(std::move(line));
        start = newline + 1;
    }
    return lines;
}

std::vector<std::string> LogTailReader::RecentTail(std::size_t max_lines) const { return recent_.Latest(max_lines); }

}  // namespace srvkeeper
