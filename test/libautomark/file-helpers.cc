#include <fstream>
#include <string>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "file-helpers.h"

static std::string GetTempDir()
{
   char const * const tmpdir = getenv("TMPDIR");
   if (tmpdir != nullptr && *tmpdir != '\0')
      return tmpdir;
   return "/tmp";
}

void helperCreateTemporaryDirectory(std::string const &id, std::string &dir)
{
   std::string const strtempdir = GetTempDir().append("/automark-tests-").append(id).append(".XXXXXX");
   char * tempdir = strdup(strtempdir.c_str());
   ASSERT_STREQ(tempdir, mkdtemp(tempdir));
   dir = tempdir;
   free(tempdir);
}
void helperRemoveDirectory(std::string const &dir)
{
   // basic sanity check to avoid removing random directories based on earlier failures
   if (dir.find("/automark-tests-") == std::string::npos || dir.find_first_of("*?") != std::string::npos)
      FAIL() << "Directory '" << dir << "' seems invalid. It is therefore not removed!";
   else
      ASSERT_EQ(0, system(std::string("rm -rf ").append(dir).c_str()));
}
void helperCreateFile(std::string const &dir, std::string const &name, char const * const content)
{
   std::string const file = dir + "/" + name;
   std::ofstream out(file);
   ASSERT_TRUE(out.is_open());
   out << content;
   out.close();
   ASSERT_FALSE(out.fail());
}

ScopedFileDeleter::ScopedFileDeleter(std::string const &filename) : _filename{filename} {}
ScopedFileDeleter::ScopedFileDeleter(ScopedFileDeleter &&sfd) = default;
ScopedFileDeleter& ScopedFileDeleter::operator=(ScopedFileDeleter &&sfd) = default;
ScopedFileDeleter::~ScopedFileDeleter() {
   if (not _filename.empty())
      unlink(_filename.c_str());
}
ScopedFileDeleter createTemporaryFile(std::string const &id, char const * const content)
{
   std::string const pattern = GetTempDir().append("/automark-").append(id).append(".XXXXXX");
   char * name = strdup(pattern.c_str());
   int const fd = mkstemp(name);
   EXPECT_NE(-1, fd);
   std::string const filename = name;
   free(name);
   if (fd == -1)
      return ScopedFileDeleter("");
   if (content != nullptr)
   {
      size_t const len = strlen(content);
      EXPECT_EQ(static_cast<ssize_t>(len), write(fd, content, len));
   }
   EXPECT_EQ(0, close(fd));
   return ScopedFileDeleter(filename);
}
