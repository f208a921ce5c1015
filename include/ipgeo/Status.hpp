#pragma once

namespace ipgeo {

static const char *const kVersion = "8.0.3";

enum class Status {
  OK = 0,
  InvalidAddress,  // neither an IPv4 nor an IPv6 address
  IOError,         // short read or file handle failure
  InvalidDatabase, // header describes a layout we cannot decode
  Closed,          // handle used after Close()
};

const char *StatusString(Status status);

} // namespace ipgeo
