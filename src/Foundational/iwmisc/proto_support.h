#ifndef FOUNDATIONAL_IWMISC_PROTO_SUPPORT_H_
#define FOUNDATIONAL_IWMISC_PROTO_SUPPORT_H_
// Functions to support operating with protos.

#include <fcntl.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "google/protobuf/text_format.h"
#include "google/protobuf/io/zero_copy_stream_impl.h"

namespace iwmisc {

// A lightweight class to open a file descrptor and make sure
// it gets closed.
class AFile {
  private:
    int _fd;

  public:
    AFile(const std::string& fname, int mode);  // O_RDONLY or O_WRONLY
    ~AFile();

    AFile(const AFile&) = delete;
    AFile& operator=(const AFile&) = delete;

    int good() const {
      return _fd >= 0;
    }

    int fd() const {
      return _fd;
    }
};

template <typename Proto>
std::optional<Proto>
ReadTextProto(const std::string& fname) {
  AFile input(fname, O_RDONLY);
  if (! input.good()) {
    std::cerr << "ReadTextProto:cannot open '" << fname << "'\n";
    return std::nullopt;
  }

  using google::protobuf::io::FileInputStream;
  std::unique_ptr<FileInputStream> zero_copy_input(new FileInputStream(input.fd()));

  Proto result;
  if (! google::protobuf::TextFormat::Parse(zero_copy_input.get(), &result)) {
    std::cerr << "ReadTextProto:cannot read '" << fname << "'\n";
    return std::nullopt;
  }

  return result;
}

}  // namespace iwmisc

#endif // FOUNDATIONAL_IWMISC_PROTO_SUPPORT_H_
