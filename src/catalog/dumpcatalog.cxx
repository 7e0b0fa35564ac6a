#include <algorithm>
#include <sstream>
#include <unistd.h>

#include <boost/algorithm/string/predicate.hpp>

#include <dumpcatalog.hxx>

using namespace pgdumpctl;
namespace bfs = boost::filesystem;

const std::string DumpCatalog::DUMP_EXTENSION = ".dump";
const std::string DumpCatalog::INPROGRESS_SUFFIX = ".inprogress";

DumpCatalog::DumpCatalog() {}

DumpCatalog::~DumpCatalog() {}

bool DumpCatalog::isDumpFileName(std::string filename) {

  /* hidden files are never dumps */
  if (filename.empty() || filename[0] == '.')
    return false;

  if (filename.length() <= DUMP_EXTENSION.length())
    return false;

  /*
   * Case sensitive, exact suffix. An in-progress file ends with
   * INPROGRESS_SUFFIX and therefore never matches.
   */
  return boost::algorithm::ends_with(filename, DUMP_EXTENSION);

}

std::string DumpCatalog::makeArtifactName(std::string connectionName,
                                          boost::posix_time::ptime timestamp,
                                          unsigned int sequence) {

  std::ostringstream name;

  name << connectionName
       << "_"
       << CPGDumpCtlBase::filename_timestamp(timestamp);

  if (sequence > 0)
    name << "_" << sequence;

  name << DUMP_EXTENSION;
  return name.str();

}

std::string DumpCatalog::inProgressName(std::string finalName) {

  return finalName + INPROGRESS_SUFFIX;

}

std::vector<DumpArtifact> DumpCatalog::list(std::shared_ptr<const ConnectionConfig> connection) {

  std::vector<DumpArtifact> result;
  boost::system::error_code ec;

  if (connection == nullptr)
    throw CPGDumpCtlFailure("cannot list dumps of undefined connection");

  if (!bfs::exists(connection->dumpPath, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "dump directory " << connection->dumpPath
                             << " of connection \"" << connection->name << "\" does not exist";
    return result;
  }

  if (!bfs::is_directory(connection->dumpPath, ec)) {
    BOOST_LOG_TRIVIAL(warning) << "dump path " << connection->dumpPath
                               << " of connection \"" << connection->name << "\" is not a directory";
    return result;
  }

  bfs::directory_iterator it(connection->dumpPath, ec);

  if (ec) {
    std::ostringstream oss;
    oss << "cannot read dump directory " << connection->dumpPath << ": " << ec.message();
    throw CPGDumpCtlFailure(oss.str());
  }

  for (; it != bfs::directory_iterator(); it.increment(ec)) {

    if (ec) {
      BOOST_LOG_TRIVIAL(warning) << "error scanning dump directory "
                                 << connection->dumpPath << ": " << ec.message();
      break;
    }

    bfs::path entry = it->path();
    std::string filename = entry.filename().string();
    DumpArtifact artifact;

    if (!isDumpFileName(filename))
      continue;

    /*
     * Files might vanish between listing the directory and
     * looking at them, skip them silently in this case.
     */
    if (!bfs::is_regular_file(entry, ec) || ec)
      continue;

    artifact.createdAt = bfs::last_write_time(entry, ec);
    if (ec)
      continue;

    artifact.sizeBytes = bfs::file_size(entry, ec);
    if (ec)
      continue;

    artifact.id = filename;
    artifact.path = entry;
    artifact.displayName = filename.substr(0, filename.length() - DUMP_EXTENSION.length());

    result.push_back(artifact);

  }

  std::sort(result.begin(), result.end(),
            [](const DumpArtifact &a, const DumpArtifact &b) {
              if (a.createdAt != b.createdAt)
                return a.createdAt > b.createdAt;
              return a.id > b.id;
            });

  return result;

}

DumpArtifact DumpCatalog::resolve(std::shared_ptr<const ConnectionConfig> connection,
                                  std::string artifactId) {

  DumpArtifact artifact;
  boost::system::error_code ec;

  if (connection == nullptr)
    throw CPGDumpCtlFailure("cannot resolve dump of undefined connection");

  /*
   * Only plain file names are accepted, anything else could
   * point outside of the dump directory.
   */
  if (artifactId.find('/') != std::string::npos
      || !isDumpFileName(artifactId)) {
    throw CDumpNotFound("invalid dump name \"" + artifactId + "\"");
  }

  bfs::path file = connection->dumpPath / artifactId;

  if (!bfs::is_regular_file(file, ec) || ec) {
    throw CDumpNotFound("dump \"" + artifactId + "\" not found in "
                        + connection->dumpPath.string());
  }

  if (::access(file.string().c_str(), R_OK) != 0) {
    throw CDumpNotFound("dump \"" + artifactId + "\" is not readable");
  }

  artifact.id = artifactId;
  artifact.path = file;
  artifact.displayName = artifactId.substr(0, artifactId.length() - DUMP_EXTENSION.length());
  artifact.createdAt = bfs::last_write_time(file, ec);
  artifact.sizeBytes = bfs::file_size(file, ec);

  if (ec) {
    throw CDumpNotFound("dump \"" + artifactId + "\" vanished during lookup");
  }

  return artifact;

}
