/*
 * Tab completion module for the pg_dumpctl interactive shell.
 *
 * NOTE: the mix of std::string C++ patterns and ordinary C
 *       string handling is a result of bad behavior
 *       of readline in conjunction with const char*. Thus,
 *       parts of this code which have to deal with readline
 *       rely heavily on C strings.
 */

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <vector>
#include <readline/readline.h>
#include <boost/algorithm/string.hpp>
/* required for string case insensitive comparison */
#include <boost/algorithm/string/predicate.hpp>

#include <tab_completion.hxx>

using namespace pgdumpctl;

/* charakters that are breaking words into pieces */
#define WORD_BREAKS "\t\n@$><=;|&{ "

/*
 * Handles used by completion callbacks. They are *not*
 * owned here, but set by init_readline().
 */
std::shared_ptr<ConnectionRegistry> compl_registry = nullptr;
std::shared_ptr<DumpCatalog> compl_dump_catalog = nullptr;
std::shared_ptr<RuntimeConfiguration> compl_runtime_cfg = nullptr;

/*
 * The identifier recognized last in the current input line,
 * dump file completion uses it as the connection name.
 */
std::string compl_last_identifier = "";

/*
 * Completion tags, used to identify completion token type.
 */
typedef enum {

              COMPL_KEYWORD,
              COMPL_IDENTIFIER,
              COMPL_END,
              COMPL_EOL

} CompletionWordType;

/*
 * Completion action, either a static array or a callback
 * building the candidates at completion time.
 */
typedef enum {

              COMPL_STATIC_ARRAY,
              COMPL_FUNC

} CompletionAction;

/*
 * Completion token definition.
 */
typedef struct _completion_word completion_word;

/* Completion list constructor callback */
typedef completion_word* (* completion_callback)(completion_word *&,
                                                 completion_word *);

typedef struct _completion_word {

  std::string name;          /* completion string passed to readline. */
  CompletionWordType type;   /* type of this completion word */
  CompletionAction action;   /* action, either a static array or completion callback */

  completion_word *next_completions; /* Might be NULL */

  completion_callback cb;              /* Might be NULL */

} completion_word;

/******************************************************************************
 * Completion callback functions.
 *****************************************************************************/

/*
 * Builds a heap allocated completion list from the given
 * identifiers, terminated by a COMPL_EOL item. The caller
 * must delete[] it.
 */
completion_word *compl_identifier(std::vector<std::string> identifiers,
                                  completion_word *& compl_list,
                                  completion_word *next_compl) {

  compl_list = new completion_word[identifiers.size() + 1];

  for (unsigned int i = 0; i < identifiers.size(); i++) {

    compl_list[i].name = identifiers[i];
    compl_list[i].type = COMPL_IDENTIFIER;
    compl_list[i].action = COMPL_STATIC_ARRAY;
    compl_list[i].next_completions = next_compl;
    compl_list[i].cb = NULL;

  }

  /*
   * Last element indicates end of completion list.
   */
  compl_list[identifiers.size()].name = "";
  compl_list[identifiers.size()].type = COMPL_EOL;
  compl_list[identifiers.size()].action = COMPL_STATIC_ARRAY;
  compl_list[identifiers.size()].next_completions = NULL;
  compl_list[identifiers.size()].cb = NULL;

  return compl_list;

}

/**
 * Completion list for runtime variables.
 */
completion_word *compl_variable(completion_word *& compl_list,
                                completion_word *next_compl) {

  std::vector<std::string> names;

  if (compl_runtime_cfg != nullptr)
    names = compl_runtime_cfg->names();

  return compl_identifier(names, compl_list, next_compl);

}

/**
 * Completion list of connection names.
 */
completion_word *compl_connection(completion_word *& compl_list,
                                  completion_word *next_compl) {

  std::vector<std::string> names;

  if (compl_registry != nullptr)
    names = compl_registry->names();

  return compl_identifier(names, compl_list, next_compl);

}

/**
 * Completion list of the dump files of the connection
 * recognized before.
 */
completion_word *compl_dumpfile(completion_word *& compl_list,
                                completion_word *next_compl) {

  std::vector<std::string> names;

  if (compl_registry != nullptr
      && compl_dump_catalog != nullptr
      && compl_registry->exists(compl_last_identifier)) {

    try {

      for (auto &artifact : compl_dump_catalog->list(compl_registry->get(compl_last_identifier)))
        names.push_back(artifact.id);

    } catch (CPGDumpCtlFailure &e) {
      /* no candidates then, the command itself reports the error */
      BOOST_LOG_TRIVIAL(debug) << "dump file completion: " << e.what();
    }

  }

  return compl_identifier(names, compl_list, next_compl);

}

/******************************************************************************
 * Completion definitions.
 *****************************************************************************/

completion_word restore_clean[]
= { { "clean", COMPL_KEYWORD, COMPL_STATIC_ARRAY, NULL, NULL },
    { "", COMPL_EOL, COMPL_STATIC_ARRAY, NULL, NULL } };

completion_word restore_dumpfile[]
= { { "<dumpfile>", COMPL_KEYWORD, COMPL_FUNC, restore_clean,
      (completion_callback) compl_dumpfile },
    { "", COMPL_EOL, COMPL_STATIC_ARRAY, NULL, NULL } };

completion_word restore_completion[]
= { { "<connection>", COMPL_KEYWORD, COMPL_FUNC, restore_dumpfile,
      (completion_callback) compl_connection },
    { "", COMPL_EOL, COMPL_STATIC_ARRAY, NULL, NULL } };

completion_word history_limit[]
= { { "<limit>", COMPL_END, COMPL_STATIC_ARRAY, NULL, NULL },
    { "", COMPL_EOL, COMPL_STATIC_ARRAY, NULL, NULL } };

completion_word history_completion[]
= { { "<connection>", COMPL_KEYWORD, COMPL_FUNC, history_limit,
      (completion_callback) compl_connection },
    { "", COMPL_EOL, COMPL_STATIC_ARRAY, NULL, NULL } };

completion_word connection_completion[]
= { { "<connection>", COMPL_KEYWORD, COMPL_FUNC, NULL,
      (completion_callback) compl_connection },
    { "", COMPL_EOL, COMPL_STATIC_ARRAY, NULL, NULL } };

completion_word set_variable_value[]
= { { "<value>", COMPL_END, COMPL_STATIC_ARRAY, NULL, NULL },
    { "", COMPL_EOL, COMPL_STATIC_ARRAY, NULL, NULL } };

completion_word set_completion[]
= { { "<variable>", COMPL_KEYWORD, COMPL_FUNC, set_variable_value,
      (completion_callback) compl_variable },
    { "", COMPL_EOL, COMPL_STATIC_ARRAY, NULL, NULL } };

completion_word show_completion[]
= { { "<variable>", COMPL_KEYWORD, COMPL_FUNC, NULL,
      (completion_callback) compl_variable },
    { "", COMPL_EOL, COMPL_STATIC_ARRAY, NULL, NULL } };

completion_word start_keyword[]
= { { "connections", COMPL_KEYWORD, COMPL_STATIC_ARRAY, NULL, NULL },
    { "list", COMPL_KEYWORD, COMPL_STATIC_ARRAY, connection_completion, NULL },
    { "dump", COMPL_KEYWORD, COMPL_STATIC_ARRAY, connection_completion, NULL },
    { "restore", COMPL_KEYWORD, COMPL_STATIC_ARRAY, restore_completion, NULL },
    { "history", COMPL_KEYWORD, COMPL_STATIC_ARRAY, history_completion, NULL },
    { "set", COMPL_KEYWORD, COMPL_STATIC_ARRAY, set_completion, NULL },
    { "show", COMPL_KEYWORD, COMPL_STATIC_ARRAY, show_completion, NULL },
    { "help", COMPL_KEYWORD, COMPL_STATIC_ARRAY, NULL, NULL },
    { "quit", COMPL_KEYWORD, COMPL_STATIC_ARRAY, NULL, NULL },
    { "", COMPL_EOL, COMPL_STATIC_ARRAY, NULL, NULL } /* marks end of list */ };

/* global buffer to hold completed input for readline callbacks */
std::vector<completion_word> completed_keywords = {};

/* Forwarded declarations */
char *keyword_generator(const char *input, int state);

/*
 * Returns the candidates of the given completion table. A table
 * headed by a callback placeholder is replaced by the list the
 * callback generates, which is heap allocated: free_candidates
 * tells the caller to delete[] it.
 */
static completion_word *expand_candidates(completion_word *table, bool &free_candidates) {

  completion_word *candidates = NULL;

  free_candidates = false;

  if (table == NULL || table[0].action != COMPL_FUNC)
    return table;

  table[0].cb(candidates, table[0].next_completions);
  free_candidates = true;

  return candidates;

}

void recognize_previous_words(std::vector<std::string> previous_words) {

  /*
   * if previous_word is empty, there's nothing to do.
   */
  if (previous_words.size() <= 0)
    return;

  /*
   * Loop through previous_words, examing
   * completion order and corresponding candidates.
   *
   * NOTE: previous_words also contains the last
   *       *uncompleted* input, so leave it out from
   *       examination.
   */
  for (unsigned int i = 0; i < previous_words.size() - 1; i++) {

    std::string current_word = previous_words[i];
    completion_word *candidates = NULL;
    bool matched = false;

    /* nothing to compare */
    if (current_word.length() <= 0)
      continue;

    /*
     * Iff the list of completed_keywords is empty, start
     * with the start_keyword array.
     */
    if (completed_keywords.size() <= 0)
      candidates = start_keyword;
    else
      candidates = completed_keywords.back().next_completions;

    if (candidates == NULL)
      break;

    /*
     * A callback placeholder expects an identifier, accept
     * whatever the user typed there.
     */
    if (candidates[0].action == COMPL_FUNC) {

      completion_word identifier = { current_word, COMPL_IDENTIFIER, COMPL_STATIC_ARRAY,
                                     candidates[0].next_completions, NULL };

      if (candidates[0].cb == (completion_callback) compl_connection)
        compl_last_identifier = current_word;

      completed_keywords.push_back(identifier);
      continue;

    }

    for (int j = 0;;j++) {

      completion_word c_word;

      c_word = candidates[j];

      /* End of list ? */
      if (c_word.type == COMPL_EOL)
        break;

      /* No completion alternatives avail ? */
      if (c_word.type == COMPL_END)
        continue;

      if (boost::iequals(current_word, std::string(c_word.name))) {

        /* push recognized completion to vector */
        completed_keywords.push_back(c_word);
        matched = true;

        /* inner loop done, next previous word */
        break;

      }

    }

    if (!matched)
      break;

  }

  return;

}

char **keyword_completion(const char *input, int start, int end) {

  std::string current_input_buf = rl_line_buffer;
  std::vector<std::string> previous_words = {};

  /*
   * Tell readline that we've finished and don't want
   * to fall back to default path completion
   */
  rl_attempted_completion_over = 1;

  /*
   * Break current input into completed words. Note that this
   * also contains the uncompleted last input.
   */
  boost::split(previous_words,
               current_input_buf,
               boost::is_any_of(WORD_BREAKS));

  /*
   * NOTE: completed_keywords will contain only the last
   *       completed words, *NOT* the current one. That's
   *       why we force the previous_words vector
   *       having two elements at least!
   */
  completed_keywords.clear();
  compl_last_identifier = "";

  if (previous_words.size() > 1) {
    recognize_previous_words(previous_words);
  }

  /*
   * Return matches.
   */
  return rl_completion_matches(input, keyword_generator);

}

void init_readline(std::shared_ptr<ConnectionRegistry> registry,
                   std::shared_ptr<DumpCatalog> catalog,
                   std::shared_ptr<RuntimeConfiguration> rtc) {

  compl_registry = registry;
  compl_dump_catalog = catalog;
  compl_runtime_cfg = rtc;

  /*
   * Setup readline callbacks
   */
  rl_attempted_completion_function = keyword_completion;

  /*
   * Set word breaks.
   */
  rl_basic_word_break_characters = (char *) WORD_BREAKS;

}

void step_readline() {

  completed_keywords.clear();
  compl_last_identifier = "";

}

static inline char *
_evaluate_keyword(completion_word *lookup_table,
                  const char *input,
                  int *index,
                  int len) {

  char * result = NULL;
  const char *name;

  /* nothing to do if lookup table is undefined */
  if (lookup_table == NULL)
    return result;

  /* Sanity check: same with index */
  if (index == NULL)
    return result;

  /*
   * Take care here, since we rely on index being
   * resettet to zero when entering this function. Index
   * is then incremented during the keyword lookup of the
   * specified lookup table.
   */
  while (lookup_table[(*index)].type != COMPL_EOL) {

    completion_word *item = &lookup_table[(*index)++];

    /* placeholders are never offered */
    if (item->type == COMPL_END
        || (!item->name.empty() && item->name[0] == '<'))
      continue;

    name = item->name.c_str();

    if (strncasecmp(name, input, len) == 0) {
      return strdup(name);
    }

  }

  /* only in case no match found, should be NULL */
  return result;
}

char *
keyword_generator(const char *input, int state) {

  static int list_index, len;
  char *result = NULL;
  completion_word *lookup = start_keyword;
  bool free_lookup = false;

  if (!state) {
    list_index = 0;
    len = strlen(input);
  }

  if (!completed_keywords.empty())
    lookup = completed_keywords.back().next_completions;

  lookup = expand_candidates(lookup, free_lookup);
  result = _evaluate_keyword(lookup, input, &list_index, len);

  /* _evaluate_keyword makes a duplicate of the returned
   * character string, so it should be safe to free it */
  if (free_lookup)
    delete[] lookup;

  return result;

}
