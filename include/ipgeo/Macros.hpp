#ifndef IPGEO_MACROS_H_
#define IPGEO_MACROS_H_

// A macro to disallow the copy constructor and operator= functions.
// This should be used in the private: declarations for a class.
#define DISALLOW_COPY_AND_ASSIGN(TypeName) \
  TypeName(const TypeName &) = delete;     \
  void operator=(const TypeName &) = delete

// Evaluates an expression yielding an ipgeo::Status and returns it from the
// enclosing function unless it is Status::OK.
#define RETURN_IF_ERROR(expr)                  \
  do {                                         \
    ::ipgeo::Status _status = (expr);          \
    if (_status != ::ipgeo::Status::OK) {      \
      return _status;                          \
    }                                          \
  } while (0)

#endif // IPGEO_MACROS_H_
