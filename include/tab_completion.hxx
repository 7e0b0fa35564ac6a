#ifndef __HAVE_TAB_COMPLETION_HXX__
#define __HAVE_TAB_COMPLETION_HXX__

#include <memory>

#include <connections.hxx>
#include <dumpcatalog.hxx>
#include <rtconfig.hxx>

/*
 * Helper functions/callbacks for readline support.
 *
 * See tab_completion.cxx for details.
 */
char **keyword_completion(const char *input, int start, int end);

/*
 * Initializes readline machinery. Connection names are completed
 * from the registry, dump files from the catalog.
 */
void init_readline(std::shared_ptr<pgdumpctl::ConnectionRegistry> registry,
                   std::shared_ptr<pgdumpctl::DumpCatalog> catalog,
                   std::shared_ptr<pgdumpctl::RuntimeConfiguration> rtc);

/*
 * Resets readline machinery after command
 * completion.
 */
void step_readline();

#endif
