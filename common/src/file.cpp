#include <algorithm>
#include <cstring>
#include <vector>
#include <dg_file.h>
#include <dg_utils.h>

bool dg::file::is_valid(const handle f) {
    return f >= 0;
}

dg::file::handle dg::file::open(const std::string &path, int flags) {
    return ::open(path.c_str(), flags, 0666);
}

void dg::file::close(handle f) {
    if (dg::file::is_valid(f)) {
        ::close(f);
    }
}

int dg::file::read(const handle f, char *buf, size_t size) {
    return ::read(f, buf, size);
}

int dg::file::get_size(const handle f) {
    struct stat stat;
    return (0 == fstat(f, &stat)) ? stat.st_size : -1;
}

int dg::file::for_each_line(const handle f, line_action action, void *arg) {
    static constexpr size_t CHUNK_SIZE = 64 * 1024;

    std::vector<char> buffer(CHUNK_SIZE);
    std::string pending;
    size_t file_idx = 0;
    size_t line_start = 0;
    int r;
    while (0 < (r = file::read(f, buffer.data(), buffer.size()))) {
        size_t from = 0;
        for (size_t i = 0; i < (size_t) r; ++i) {
            int c = buffer[i];
            if (c != '\r' && c != '\n') {
                continue;
            }
            pending.append(&buffer[from], i - from);
            std::string_view line = pending;
            utils::trim(line);
            if (!action(line_start, line, arg)) {
                return 0;
            }
            pending.clear();
            from = i + 1;
            line_start = file_idx + from;
        }
        pending.append(&buffer[from], r - from);
        file_idx += r;
    }
    if (r < 0) {
        return -1;
    }

    std::string_view line = pending;
    utils::trim(line);
    if (!line.empty()) {
        action(line_start, line, arg);
    }

    return 0;
}
