#ifndef __HAVE_OUTPUT_HXX__
#define __HAVE_OUTPUT_HXX__

#include <sstream>
#include <boost/property_tree/ptree.hpp>

#include <connections.hxx>
#include <dumpcatalog.hxx>
#include <history.hxx>
#include <operation.hxx>
#include <rtconfig.hxx>

namespace pgdumpctl {

  /**
   * Output format identifier.
   */
  typedef enum {
                OUTPUT_CONSOLE,
                OUTPUT_JSON
  } OutputFormatType;

  /**
   * This is an abstract base class for output formatting
   *
   * Converts listings and operation results into the output
   * format implemented by its descendants. Passwords of
   * connections are never part of the output.
   */
  class OutputFormatter {
  protected:

    /* Internal reference to runtime settings */
    std::shared_ptr<RuntimeConfiguration> config = nullptr;

  public:

    OutputFormatter(std::shared_ptr<RuntimeConfiguration> config);
    virtual ~OutputFormatter();

    /*
     * These are abstract output methods, required to be implemented
     * by descendants.
     */
    virtual void nodeAs(std::string connection,
                        std::vector<DumpArtifact> &list,
                        std::ostringstream &output) = 0;
    virtual void nodeAs(const OperationResult &result,
                        std::ostringstream &output) = 0;
    virtual void nodeAs(std::vector<std::shared_ptr<const ConnectionConfig>> connections,
                        std::ostringstream &output) = 0;
    virtual void nodeAs(std::vector<HistoryEntry> &entries,
                        std::ostringstream &output) = 0;
    virtual void nodeAs(std::shared_ptr<RuntimeConfiguration> rtc,
                        std::ostringstream &output) = 0;
    virtual void nodeAs(std::shared_ptr<ConfigVariable> var,
                        std::ostringstream &output) = 0;

    /**
     * Formats an error message, output_type is either
     * "console" or "json".
     */
    static void nodeAs(std::exception &e,
                       std::ostringstream &output,
                       std::string output_type);

    /**
     * Static factory method, returns an instance of
     * OutputFormatter for the specified output format.
     */
    static std::shared_ptr<OutputFormatter> formatter(std::shared_ptr<RuntimeConfiguration> config,
                                                      OutputFormatType type);

    /**
     * Same as above, the type is taken from the output.format
     * runtime variable.
     */
    static std::shared_ptr<OutputFormatter> formatter(std::shared_ptr<RuntimeConfiguration> config);

  };

  class ConsoleOutputFormatter : public OutputFormatter {
  public:

    ConsoleOutputFormatter(std::shared_ptr<RuntimeConfiguration> config);
    virtual ~ConsoleOutputFormatter();

    virtual void nodeAs(std::string connection,
                        std::vector<DumpArtifact> &list,
                        std::ostringstream &output);
    virtual void nodeAs(const OperationResult &result,
                        std::ostringstream &output);
    virtual void nodeAs(std::vector<std::shared_ptr<const ConnectionConfig>> connections,
                        std::ostringstream &output);
    virtual void nodeAs(std::vector<HistoryEntry> &entries,
                        std::ostringstream &output);
    virtual void nodeAs(std::shared_ptr<RuntimeConfiguration> rtc,
                        std::ostringstream &output);
    virtual void nodeAs(std::shared_ptr<ConfigVariable> var,
                        std::ostringstream &output);

  };

  class JsonOutputFormatter : public OutputFormatter {
  private:

    /**
     * Internal method to convert an OperationResult
     * to a json ptree representation
     */
    boost::property_tree::ptree toPtree(const OperationResult &result);

  public:

    JsonOutputFormatter(std::shared_ptr<RuntimeConfiguration> config);
    virtual ~JsonOutputFormatter();

    virtual void nodeAs(std::string connection,
                        std::vector<DumpArtifact> &list,
                        std::ostringstream &output);
    virtual void nodeAs(const OperationResult &result,
                        std::ostringstream &output);
    virtual void nodeAs(std::vector<std::shared_ptr<const ConnectionConfig>> connections,
                        std::ostringstream &output);
    virtual void nodeAs(std::vector<HistoryEntry> &entries,
                        std::ostringstream &output);
    virtual void nodeAs(std::shared_ptr<RuntimeConfiguration> rtc,
                        std::ostringstream &output);
    virtual void nodeAs(std::shared_ptr<ConfigVariable> var,
                        std::ostringstream &output);

  };

}

#endif
