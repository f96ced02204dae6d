#ifndef FS_DOT_HPP
#define FS_DOT_HPP

// Short names for the filesystem library, shared by everything that
// touches ROA files and the log.

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;
using std::error_code;

#endif // FS_DOT_HPP
