
#include "stdinc.hpp"

#include "file-system.hpp"

#include <cerrno>
#include <filesystem>

namespace anthro
{
// ----------------------------------------------------------- file-get-contents

error_code file_get_contents(const std::string_view fname,
                             std::string& data) noexcept
{
   const string filename(fname);
   std::unique_ptr<FILE, std::function<void(FILE*)>> fp(
       fopen(filename.c_str(), "rb"), [](FILE* ptr) {
          if(ptr) fclose(ptr);
       });

   if(fp == nullptr) return std::make_error_code(std::errc(errno));

   if(fseek(fp.get(), 0, SEEK_END) == -1)
      return std::make_error_code(std::errc(errno));

   auto fpos = ftell(fp.get());
   if(fpos == -1) return std::make_error_code(std::errc(errno));

   auto sz = size_t(fpos < 0 ? 0 : fpos);

   try {
      data.resize(sz);
   } catch(std::length_error&) {
      return std::make_error_code(std::errc::not_enough_memory);
   } catch(std::bad_alloc&) {
      return std::make_error_code(std::errc::not_enough_memory);
   }

   if(fseek(fp.get(), 0, SEEK_SET) == -1)
      return std::make_error_code(std::errc(errno));

   if(sz > 0 and fread(&data[0], 1, sz, fp.get()) != sz)
      return std::make_error_code(std::errc::io_error);

   return {};
}

std::string file_get_contents(const std::string_view fname) noexcept(false)
{
   std::string out;
   const auto ec = file_get_contents(fname, out);
   if(ec)
      throw std::runtime_error(
          format("failed to read file '{}': {}", fname, ec.message()));
   return out;
}

// ----------------------------------------------------------- file-put-contents

error_code file_put_contents(const std::string_view fname,
                             const std::string_view dat) noexcept
{
   const string filename(fname);
   FILE* fp = fopen(filename.c_str(), "wb");
   if(fp == nullptr) return std::make_error_code(std::errc(errno));

   error_code ec = {};

   auto sz = fwrite(dat.data(), 1, dat.size(), fp);
   if(sz != dat.size()) {
      if(ferror(fp))
         ec = std::make_error_code(std::errc(errno));
      else
         ec = std::make_error_code(std::errc::io_error);
   }
   if(fclose(fp) != 0)
      if(!ec) ec = std::make_error_code(std::errc(errno));

   return ec;
}

// ----------------------------------------------------------- is-file/directory

bool is_regular_file(const std::string_view filename) noexcept
{
   std::error_code ec;
   return std::filesystem::is_regular_file(std::filesystem::path(filename), ec);
}

bool is_directory(const std::string_view filename) noexcept
{
   std::error_code ec;
   return std::filesystem::is_directory(std::filesystem::path(filename), ec);
}

// --------------------------------------------------- basename/dirname/file_ext

std::string basename(const std::string_view filename,
                     const bool strip_extension) noexcept
{
   const auto p = std::filesystem::path(filename);
   return strip_extension ? p.stem().string() : p.filename().string();
}

std::string dirname(const std::string_view filename) noexcept
{
   auto ret = std::filesystem::path(filename).parent_path().string();
   return ret.empty() ? "."s : ret;
}

std::string file_ext(const std::string_view filename) noexcept
{
   return std::filesystem::path(filename).extension().string();
}

} // namespace anthro
