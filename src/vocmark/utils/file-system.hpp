
#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace vocmark
{
using std::error_code;

// ------------------------------------------------------- file-get/put-contents

error_code file_get_contents(const std::string_view fname,
                             std::string& out) noexcept;

// Throws std::runtime_error if `fname` cannot be read
std::string file_get_contents(const std::string_view fname) noexcept(false);

// Creates or truncates `fname`
error_code file_put_contents(const std::string_view fname,
                             const std::string_view dat) noexcept;

// ------------------------------------------------------------------- file-info

bool is_regular_file(const std::string_view fname) noexcept;
bool is_directory(const std::string_view dname) noexcept;

// ---------------------------------------------------------------------- paths

std::string absolute_path(const std::string_view fname);
std::string basename(const std::string_view fname, bool strip_ext = false);
std::string dirname(const std::string_view fname);
std::string file_ext(const std::string_view fname); // like ".jpg"

// Regular files directly inside `dname`, sorted. Empty (with a warning) if
// `dname` cannot be listed.
std::vector<std::string> list_regular_files(const std::string_view dname);

// ------------------------------------------------------ create/remove things

bool mkdir_p(const std::string_view dname) noexcept;

// A fresh directory named `prefix` followed by random characters
std::string make_temp_directory(const std::string_view prefix) noexcept(false);

error_code delete_file(const std::string_view fname) noexcept;

// Returns the number of entries removed
size_t remove_all(const std::string_view path) noexcept(false);

} // namespace vocmark
