// AFile implementation functions.

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "Foundational/iwmisc/proto_support.h"

namespace iwmisc {

AFile::AFile(const std::string& fname, int mode) {
  int flags = S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH;
  _fd = ::open(fname.c_str(), mode, flags);
}

AFile::~AFile() {
  if (_fd >= 0) {
    ::close(_fd);
  }
}

}  // namespace iwmisc
