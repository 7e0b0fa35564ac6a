#ifndef __HAVE_DUMPCATALOG_HXX__
#define __HAVE_DUMPCATALOG_HXX__

#include <ctime>
#include <memory>
#include <string>
#include <vector>

#include <common.hxx>
#include <connections.hxx>

namespace pgdumpctl {

  /**
   * A requested dump artifact doesn't exist (anymore) or
   * isn't a valid artifact name.
   */
  class CDumpNotFound : public CPGDumpCtlFailure {
  public:
    CDumpNotFound(const char *errstr) : CPGDumpCtlFailure(errstr) {};
    CDumpNotFound(std::string errstr) : CPGDumpCtlFailure(errstr) {};
  };

  /**
   * Descriptor of a completed dump file below a
   * connection's dump directory.
   */
  class DumpArtifact {
  public:

    /* The plain file name, used to identify the artifact */
    std::string id = "";

    boost::filesystem::path path;

    /* File name without the dump extension */
    std::string displayName = "";

    /* Modification time, seconds since epoch */
    std::time_t createdAt = 0;

    uintmax_t sizeBytes = 0;

  };

  /**
   * Transient view over the dump directory of a connection.
   *
   * Nothing is cached, every call rescans the file system. Files
   * still being written carry the in-progress suffix and are never
   * part of a listing.
   */
  class DumpCatalog {
  public:

    static const std::string DUMP_EXTENSION;
    static const std::string INPROGRESS_SUFFIX;

    DumpCatalog();
    virtual ~DumpCatalog();

    /**
     * Returns all completed dumps of the connection, newest
     * first (ties ordered by file name, descending). A missing
     * dump directory yields an empty list.
     */
    virtual std::vector<DumpArtifact> list(std::shared_ptr<const ConnectionConfig> connection);

    /**
     * Looks up the artifact by its file name. Throws CDumpNotFound
     * if the name is invalid or the file isn't a readable regular
     * file at the time of the call.
     */
    virtual DumpArtifact resolve(std::shared_ptr<const ConnectionConfig> connection,
                                 std::string artifactId);

    /**
     * True if the file name denotes a completed dump.
     */
    static bool isDumpFileName(std::string filename);

    /**
     * Builds {connection}_{timestamp}.dump. A sequence number
     * larger than 0 is appended to the timestamp to avoid
     * collisions with an existing artifact.
     */
    static std::string makeArtifactName(std::string connectionName,
                                        boost::posix_time::ptime timestamp,
                                        unsigned int sequence = 0);

    static std::string inProgressName(std::string finalName);

  };

}

#endif
