#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace {

// Owns the descriptor and the read-only mapping; both released on scope exit.
class ReadOnlyMapping {
public:
  ReadOnlyMapping() = default;
  ReadOnlyMapping(const ReadOnlyMapping&) = delete;
  ReadOnlyMapping& operator=(const ReadOnlyMapping&) = delete;
  ~ReadOnlyMapping() {
    if (mem_ && mem_ != MAP_FAILED) ::munmap(mem_, size_);
    if (fd_ >= 0) ::close(fd_);
  }

  bool open(const std::filesystem::path& path, std::string& msg) {
    fd_ = ::open(path.string().c_str(), O_RDONLY);
    if (fd_ < 0) { msg = std::string("can not open file: ") + path.string(); return false; }
    struct stat st{};
    if (::fstat(fd_, &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
    size_ = static_cast<size_t>(st.st_size);
    if (size_ == 0) return true;
    mem_ = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
    if (mem_ == MAP_FAILED) { msg = std::string("can not mmap file: ") + path.string(); return false; }
    return true;
  }

  const char* data() const { return static_cast<const char*>(mem_); }
  size_t size() const { return size_; }

private:
  int fd_ = -1;
  void* mem_ = nullptr;
  size_t size_ = 0;
};

} // namespace

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  ReadOnlyMapping m;
  if (!m.open(path, msg)) return false;
  const char* data = m.data();
  size_t n = m.size();
  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] == '\n') {
      size_t end = i;
      if (end > start && data[end - 1] == '\r') end--;
      out_lines.emplace_back(data + start, end - start);
      start = i + 1;
    }
  }
  if (start < n) {
    size_t end = n;
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data + start, end - start);
  }
  msg = std::string("read file: ") + path.string();
  return true;
}
