#pragma once

#include <stdint.h>
#include <string>
#include <vector>
#include <boost/program_options.hpp>

namespace ipgeo {
struct Option {
  std::string db_path_;
  std::string fields_ = "all";
  std::vector<std::string> addresses_;
  bool json_    = false;
  bool meta_    = false;
  bool verbose_ = false;

  uint32_t mask_ = 0; // parsed from fields_

  inline bool ReadStdin() const { return addresses_.empty() && !meta_; }
};

// Exits the process on --help and on invalid options.
void ParseOption(int argc, char *argv[], Option &opt);
} // namespace ipgeo
