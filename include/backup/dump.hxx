#ifndef __HAVE_DUMP_HXX__
#define __HAVE_DUMP_HXX__

#include <memory>

#include <connections.hxx>
#include <dumpcatalog.hxx>
#include <processrunner.hxx>
#include <rtconfig.hxx>

namespace pgdumpctl {

  /**
   * Produces a new dump artifact of a connection by
   * running pg_dump into a temporary file, which is renamed
   * to its final name only if pg_dump succeeded.
   */
  class DumpOperation : public RuntimeVariableEnvironment {
  private:

    std::shared_ptr<ProcessRunner> runner = nullptr;

    void removeTemporary(boost::filesystem::path tmpfile);

  public:

    DumpOperation(std::shared_ptr<ProcessRunner> runner,
                  std::shared_ptr<RuntimeConfiguration> rtc);
    virtual ~DumpOperation();

    /**
     * Runs the dump. Failures of pg_dump and cancellation are
     * reported through the result, in both cases no file is
     * left behind.
     */
    virtual OperationResult execute(std::shared_ptr<const ConnectionConfig> connection,
                                    JobSignalHandler *cancel);

    /**
     * Builds the pg_dump invocation writing into outputFile.
     */
    static ProcessCommand buildCommand(std::shared_ptr<const ConnectionConfig> connection,
                                       boost::filesystem::path outputFile,
                                       std::string executable);

  };

}

#endif
