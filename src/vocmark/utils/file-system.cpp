
#include "stdinc.hpp"

#include "file-system.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>

#include <stdlib.h>

namespace vocmark
{
namespace fs = std::filesystem;

static error_code last_errno_or(std::errc fallback) noexcept
{
   return (errno != 0) ? error_code(errno, std::generic_category())
                       : std::make_error_code(fallback);
}

// ----------------------------------------------------------- file-get-contents
//
error_code file_get_contents(const std::string_view fname,
                             std::string& out) noexcept
{
   error_code ec;
   const auto sz = fs::file_size(fs::path(fname), ec);
   if(ec) return ec;

   errno = 0;
   std::ifstream in(string(fname), std::ios::binary);
   if(!in) return last_errno_or(std::errc::io_error);

   try {
      out.resize(size_t(sz));
   } catch(std::exception&) {
      return std::make_error_code(std::errc::not_enough_memory);
   }

   if(sz > 0 and !in.read(&out[0], std::streamsize(sz)))
      return std::make_error_code(std::errc::io_error);

   return {};
}

string file_get_contents(const std::string_view fname) noexcept(false)
{
   string out;
   if(auto ec = file_get_contents(fname, out); ec)
      throw std::runtime_error(
          format("failed to read '{}': {}", fname, ec.message()));
   return out;
}

// ----------------------------------------------------------- file-put-contents
//
error_code file_put_contents(const std::string_view fname,
                             const std::string_view dat) noexcept
{
   errno = 0;
   std::ofstream out(string(fname), std::ios::binary | std::ios::trunc);
   if(!out) return last_errno_or(std::errc::io_error);

   out.write(dat.data(), std::streamsize(dat.size()));
   out.close();
   if(!out) return last_errno_or(std::errc::io_error);

   return {};
}

// ------------------------------------------------------------------- file-info
//
bool is_regular_file(const std::string_view fname) noexcept
{
   error_code ec;
   return fs::is_regular_file(fs::path(fname), ec);
}

bool is_directory(const std::string_view dname) noexcept
{
   error_code ec;
   return fs::is_directory(fs::path(dname), ec);
}

// ----------------------------------------------------------------------- paths
//
string absolute_path(const std::string_view fname)
{
   return fs::absolute(fs::path(fname)).lexically_normal().string();
}

string basename(const std::string_view fname, bool strip_ext)
{
   const fs::path p(fname);
   return strip_ext ? p.stem().string() : p.filename().string();
}

string dirname(const std::string_view fname)
{
   return fs::path(fname).parent_path().string();
}

string file_ext(const std::string_view fname)
{
   return fs::path(fname).extension().string();
}

// ---------------------------------------------------------- list-regular-files
//
vector<string> list_regular_files(const std::string_view dname)
{
   vector<string> out;
   error_code ec;
   for(fs::directory_iterator ii(fs::path(dname), ec), end; !ec and ii != end;
       ii.increment(ec)) {
      error_code ec2;
      if(ii->is_regular_file(ec2)) out.push_back(ii->path().string());
   }

   if(ec) WARN(format("failed to list '{}': {}", dname, ec.message()));

   std::sort(begin(out), end(out));
   return out;
}

// --------------------------------------------------------------------- mkdir-p
//
bool mkdir_p(const std::string_view dname) noexcept
{
   error_code ec;
   fs::create_directories(fs::path(dname), ec);
   return !ec and is_directory(dname);
}

// --------------------------------------------------------- make-temp-directory
//
string make_temp_directory(const std::string_view prefix) noexcept(false)
{
   // mkdtemp replaces the trailing "XXXXXX" in place
   string templ = format("{}XXXXXX", prefix);
   if(mkdtemp(templ.data()) == nullptr)
      throw std::runtime_error(format("failed to create temporary directory "
                                      "'{}': {}",
                                      templ,
                                      std::strerror(errno)));
   return templ;
}

// -------------------------------------------------------------- delete/remove
//
error_code delete_file(const std::string_view fname) noexcept
{
   error_code ec;
   fs::remove(fs::path(fname), ec);
   return ec;
}

size_t remove_all(const std::string_view path) noexcept(false)
{
   error_code ec;
   const auto n = fs::remove_all(fs::path(path), ec);
   if(ec)
      throw std::runtime_error(
          format("failed to remove '{}': {}", path, ec.message()));
   return size_t(n);
}

} // namespace vocmark
