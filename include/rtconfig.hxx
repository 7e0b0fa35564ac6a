#ifndef __HAVE_RUNTIME_CONFIG_VARIABLES__
#define __HAVE_RUNTIME_CONFIG_VARIABLES__

#include <common.hxx>
#include <memory>
#include <vector>
#include <unordered_set>
#include <unordered_map>

namespace pgdumpctl {

  typedef void (*config_variable_assign_hook)(std::string val);

  /**
   * Base class for config runtime variables.
   */
  class ConfigVariable {
  protected:

    /* Identifier of a ConfigVariable object instance */
    std::string name = "unknown";

    /*
     * Assign hook function pointer. Only valid
     * if an assign function was specified by set_assign_hook()
     */
    config_variable_assign_hook assign_hook = NULL;

    /* Calls the assign hook with the current value, if any */
    virtual void call_assign_hook();

  public:

    virtual ~ConfigVariable() {};


    virtual std::string getName();

    virtual void setValue(std::string value);
    virtual void setValue(bool value);
    virtual void setValue(int value);

    /**
     * Assigns a value given in its textual representation,
     * e.g. from the command line. Each variable type converts
     * the string on its own and throws CPGDumpCtlFailure
     * if the conversion fails.
     */
    virtual void assign(std::string value) = 0;

    virtual void setDefault(std::string defaultval);
    virtual void setDefault(bool defaultval);
    virtual void setDefault(int value);
    virtual void setRange(int min, int max);

    virtual void getValue(std::string &value);
    virtual void getValue(int &value);
    virtual void getValue(bool &value);


    virtual void set_assign_hook(config_variable_assign_hook ahook);

    /** Recalls the assign hook if available. */
    virtual void reassign();

    virtual void reset();
  };

  class BoolConfigVariable : public ConfigVariable {
  private:
    bool value = false;
    bool default_value = false;
  public:

    BoolConfigVariable(std::string name);
    BoolConfigVariable(std::string name, bool value, bool defaultval);
    virtual ~BoolConfigVariable() {};

    virtual void setValue(bool value);
    virtual void assign(std::string value);
    virtual void setDefault(bool value);
    virtual void getValue(bool &value);

    /**
     * Returns the string represention of the current
     * bool value.
     */
    virtual void getValue(std::string &value);

    virtual void reset();

  };

  class StringConfigVariable : public ConfigVariable {
  private:

    std::string value = "";
    std::string default_value = "";

  public:

    StringConfigVariable();
    StringConfigVariable(std::string name);
    StringConfigVariable(std::string name,
                         std::string value,
                         std::string defaultval);
    virtual ~StringConfigVariable() {};

    virtual void setValue(std::string value);
    virtual void assign(std::string value);
    virtual void setDefault(std::string defaultval);
    virtual void getValue(std::string &value);

    virtual void reset();

  };

  class EnumConfigVariable : public ConfigVariable {
  private:
    std::unordered_set<std::string> allowed_values;
    std::string value = "";
    std::string default_value = "";

    /**
     * Check the specified value if it's in the list
     * of allowed values. Throws a CPGDumpCtlFailure
     * in case it is not found.
     */
    void check_value(std::string value);
  public:

    EnumConfigVariable(std::string name);
    EnumConfigVariable(std::string name,
                       std::string value,
                       std::string defaultval,
                       std::unordered_set<std::string> possible_values);
    virtual ~EnumConfigVariable() {};

    /**
     * Throws a CPGDumpCtlFailure
     * exception in case the value is rejected.
     */
    virtual void setValue(std::string value);
    virtual void assign(std::string value);

    /**
     * Sets the default value.
     *
     * NOTE: The caller need to initialize the list of
     *       possible values first, otherwise even
     *       the default value will be rejected.
     */
    virtual void setDefault(std::string defaultval);

    virtual void getValue(std::string &value);

    virtual void reset();

  };

  class IntegerConfigVariable : public ConfigVariable {
  private:
    int value = 0;
    int default_value = 0;

    bool enforce_rangecheck = false;

    /*
     * allowed range for values
     */
    int min = 0;
    int max = 0;

    virtual void check(int value);

  public:

    IntegerConfigVariable(std::string name);
    IntegerConfigVariable(std::string name,
                          int value,
                          int defaultval,
                          int range_min,
                          int range_max);
    virtual ~IntegerConfigVariable() {};

    /**
     * Sets the range of valid values.
     *
     * Throws CPGDumpCtlFailure if min is larger than max.
     */
    virtual void setRange(int min, int max);

    virtual void setValue(int value);
    virtual void assign(std::string value);
    virtual void setDefault(int defaultval);
    virtual void getValue(int &value);
    virtual void getValue(std::string &value);

    virtual void reset();

  };

  /**
   * Runtime configuration class, encapsulates access
   * to configuration variables used, set and updated
   * during runtime.
   *
   * Every ConfigVariable instance is managed as a shared
   * pointer internally, so changes through any copy of a
   * reference are visible to every layer sharing the same
   * runtime configuration.
   */
  class RuntimeConfiguration {
  protected:
    std::unordered_map<std::string, std::shared_ptr<ConfigVariable>> variables;
  public:

    RuntimeConfiguration();
    virtual ~RuntimeConfiguration();

    virtual std::shared_ptr<ConfigVariable> get(std::string name);


    /**
     * Assigns the textual value to the named variable, converted
     * according to the variable type.
     */
    virtual std::shared_ptr<ConfigVariable> assign(std::string name,
                                                   std::string value);

    /**
     * Parses an assignment of the form name=value and
     * applies it via assign().
     */
    virtual std::shared_ptr<ConfigVariable> assign(std::string assignment);

    virtual std::shared_ptr<ConfigVariable> create(std::string name, int value, int default_value,
                                                   int range_min, int range_max);
    virtual std::shared_ptr<ConfigVariable> create(std::string name,
                                                   std::string value,
                                                   std::string default_value,
                                                   std::unordered_set<std::string> possible_values);
    virtual std::shared_ptr<ConfigVariable> create(std::string name,
                                                   std::string value,
                                                   std::string default_value);
    virtual std::shared_ptr<ConfigVariable> create(std::string name,
                                                   bool value,
                                                   bool default_value);

    /** Shortcuts for typed lookups */
    virtual std::string getString(std::string name);
    virtual int getInt(std::string name);
    virtual bool getBool(std::string name);

    /** Sorted list of all variable names */
    virtual std::vector<std::string> names();

    virtual void reset(std::string name);

    virtual size_t count_variables();

  };

  /**
   * Base interface for classes using runtime configurations.
   *
   * This is a shell class, transporting references to runtime
   * object instances. Usually they aren't instantiated
   * by this shell class itself, but are created and assigned
   * from a single caller.
   */
  class RuntimeVariableEnvironment {
  protected:
    std::shared_ptr<RuntimeConfiguration> runtime_config = nullptr;
  public:

    RuntimeVariableEnvironment() {};
    RuntimeVariableEnvironment(std::shared_ptr<RuntimeConfiguration>);
    virtual ~RuntimeVariableEnvironment() {};

    /**
     * Factory method, returns a runtime configuration
     * with all pg_dumpctl variables registered and set
     * to their defaults.
     */
    static std::shared_ptr<RuntimeConfiguration> createRuntimeConfiguration();


  };

}

#endif
