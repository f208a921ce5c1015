#include "ipgeo/Status.hpp"

namespace ipgeo {

const char *StatusString(Status status) {
  switch (status) {
  case Status::OK:
    return "ok";
  case Status::InvalidAddress:
    return "invalid IP address";
  case Status::IOError:
    return "i/o error";
  case Status::InvalidDatabase:
    return "invalid database";
  case Status::Closed:
    return "database closed";
  }
  return "unknown";
}

} // namespace ipgeo
