/*
    Strictbf - A bounds-checked brainfuck interpreter
    Source file loading
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "loader.hxx"

#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

#include "strictbf.hxx"

#ifndef _WIN32
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace {
#ifndef _WIN32
// Read-only mapping of a whole file, released on destruction
class MappedFile {
   public:
    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    ~MappedFile() {
        if (data) munmap(const_cast<char*>(data), size);
        if (fd >= 0) ::close(fd);
    }

    bool open(const std::string& path) {
        fd = ::open(path.c_str(), O_RDONLY);
        if (fd < 0) return false;
        struct stat st{};
        if (fstat(fd, &st) != 0) return false;
        size = static_cast<size_t>(st.st_size);
        if (size == 0) return true;
        void* view = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
        if (view == MAP_FAILED) {
            size = 0;
            return false;
        }
        data = static_cast<const char*>(view);
        return true;
    }

    std::string_view view() const noexcept { return {data ? data : "", data ? size : 0}; }

   private:
    const char* data = nullptr;
    size_t size = 0;
    int fd = -1;
};
#endif

bool readWhole(const std::string& path, std::string& out, std::string& err) {
#ifndef _WIN32
    {
        MappedFile mf;
        if (mf.open(path)) {
            out.assign(mf.view());
            return true;
        }
    }
#endif
    // Fallback: stream
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        err = "file could not be opened: " + path;
        return false;
    }
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        err = "error while reading file: " + path;
        return false;
    }
    out.swap(contents);
    return true;
}
}  // namespace

bool strictbf::hasSourceExtension(std::string_view path) noexcept {
    return path.ends_with(STRICTBF_SOURCE_EXTENSION);
}

bool strictbf::loadSource(const std::string& path, std::string& out, std::string& err) {
    if (!hasSourceExtension(path)) {
        err = "cannot run code from a file that does not have the extension " STRICTBF_SOURCE_EXTENSION;
        return false;
    }
    std::string contents;
    if (!readWhole(path, contents, err)) return false;
    if (contents.empty()) {
        err = "file does not contain any code to execute.";
        return false;
    }
    out.swap(contents);
    return true;
}
