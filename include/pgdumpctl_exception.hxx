#ifndef __HAVE_PGDUMPCTL_EXCEPTION_HXX__
#define __HAVE_PGDUMPCTL_EXCEPTION_HXX__

#include <string>

namespace pgdumpctl {

  /**
   * Base exception class
   */
  class CPGDumpCtlFailure : public std::exception {

  protected:
    std::string errstr;

  public:

    explicit CPGDumpCtlFailure(const char *errString) noexcept(false) : errstr() {
      errstr = errString;
    }

    explicit CPGDumpCtlFailure(std::string errString) noexcept(false) : errstr() {
      errstr = errString;
    }

    virtual ~CPGDumpCtlFailure()  {}

    const char *what() const noexcept(true) override {
      return errstr.c_str();
    }

  };

  /**
   * Raised by operations which observed a cancellation
   * request (signal or timeout) before they could finish.
   */
  class COperationCancelled : public CPGDumpCtlFailure {
  public:
    COperationCancelled(const char *errstr) : CPGDumpCtlFailure(errstr) {};
    COperationCancelled(std::string errstr) : CPGDumpCtlFailure(errstr) {};
  };

}

#endif
