#ifndef AUTOMARK_TESTS_FILE_HELPERS
#define AUTOMARK_TESTS_FILE_HELPERS

#include <string>

#include <gtest/gtest.h>

#define createTemporaryDirectory(id, dir) \
   ASSERT_NO_FATAL_FAILURE(helperCreateTemporaryDirectory(id, dir))
void helperCreateTemporaryDirectory(std::string const &id, std::string &dir);
#define removeDirectory(dir) \
   ASSERT_NO_FATAL_FAILURE(helperRemoveDirectory(dir))
void helperRemoveDirectory(std::string const &dir);
#define createFile(dir, name, content) \
   ASSERT_NO_FATAL_FAILURE(helperCreateFile(dir, name, content))
void helperCreateFile(std::string const &dir, std::string const &name, char const * const content = "");

class ScopedFileDeleter {
   std::string _filename;
public:
   ScopedFileDeleter(std::string const &filename);
   ScopedFileDeleter(ScopedFileDeleter const &) = delete;
   ScopedFileDeleter(ScopedFileDeleter &&);
   ScopedFileDeleter& operator=(ScopedFileDeleter const &) = delete;
   ScopedFileDeleter& operator=(ScopedFileDeleter &&);
   ~ScopedFileDeleter();

   std::string Name() const { return _filename; }
};
ScopedFileDeleter createTemporaryFile(std::string const &id, char const * const content = nullptr);

#endif
