#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>

namespace fwunpack {

// Creates (or truncates) a regular output file.
class FileWriter final : public IWriter {
  public:
    static Result Open(std::string path, FileWriter& out);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result Close();

  private:
    std::string path_;
    Fd fd_;
};

} // namespace fwunpack
