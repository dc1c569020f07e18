#pragma once

#include <cstdint>
#include <string_view>
#include <string>
#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>

namespace dg::file {

    using handle = int;
    static constexpr int INVALID_HANDLE = -1;

    enum flags {
        RDONLY = O_RDONLY,
        WRONLY = O_WRONLY,
        RDWR = O_RDWR,
        CREAT = O_CREAT,
    };

    /**
     * @brief      Check if file handle is valid
     * @param[in]  f     file handle
     * @return     True if valid, false otherwise
     */
    bool is_valid(const handle f);

    /**
     * @brief      Open file by path
     * @param[in]  path   system path
     * @param[in]  flags  file mode flags
     * @return     Handle of file
     */
    handle open(const std::string &path, int flags);

    /**
     * @brief      Close file
     * @param[in]  f     file handle
     */
    void close(handle f);

    /**
     * @brief      Read from file
     * @return     Number of bytes read, or -1 on error
     */
    int read(const handle f, char *buf, size_t size);

    /**
     * @brief      Get file size
     * @return     File size in bytes, or -1 on error
     */
    int get_size(const handle f);

    /**
     * Line action: called for every trimmed line of the file
     * @param      idx   line offset in the file
     * @param      line  line contents
     * @param      arg   user argument
     * @return     false to stop the iteration
     */
    using line_action = bool (*)(uint32_t idx, std::string_view line, void *arg);

    /**
     * @brief      Apply the action to each line of the file
     * @return     0 on success, -1 on read error
     */
    int for_each_line(const handle f, line_action action, void *arg);

} // namespace dg::file
