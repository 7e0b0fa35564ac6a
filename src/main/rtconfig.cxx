#include <algorithm>
#include <sstream>

#include <rtconfig.hxx>

using namespace pgdumpctl;
using namespace std;

/* *****************************************************************************
 * ConfigVariable Base class
 * ****************************************************************************/

string ConfigVariable::getName() {
  return this->name;
}

void ConfigVariable::set_assign_hook(config_variable_assign_hook ahook) {

  if (ahook != NULL) {
    assign_hook = ahook;
  }

}

void ConfigVariable::call_assign_hook() {

  if (this->assign_hook != NULL) {

    string valstr;

    this->getValue(valstr);
    this->assign_hook(valstr);

  }

}

void ConfigVariable::reassign() {

  this->call_assign_hook();

}

void ConfigVariable::setValue(string value) {
  throw CPGDumpCtlFailure("cannot assign a string to runtime variable \"" + this->name + "\"");
}

void ConfigVariable::setValue(int value) {
  throw CPGDumpCtlFailure("cannot assign an integer to runtime variable \"" + this->name + "\"");
}

void ConfigVariable::setValue(bool value) {
  throw CPGDumpCtlFailure("cannot assign a boolean to runtime variable \"" + this->name + "\"");
}

void ConfigVariable::setDefault(string defaultval) {
  throw CPGDumpCtlFailure("cannot use runtime variable assignment in default implementation");
}

void ConfigVariable::setDefault(int defaultval) {
  throw CPGDumpCtlFailure("cannot use runtime variable assignment in default implementation");
}

void ConfigVariable::setDefault(bool defaultval) {
  throw CPGDumpCtlFailure("cannot use runtime variable assignment in default implementation");
}

void ConfigVariable::setRange(int min, int max) {
  throw CPGDumpCtlFailure("enforcing range not possible in base configuration implementation");
}

void ConfigVariable::getValue(std::string &value) {
  throw CPGDumpCtlFailure("cannot retrieve value from base configuration class");
}

void ConfigVariable::getValue(bool &value) {
  throw CPGDumpCtlFailure("runtime variable \"" + this->name + "\" is not a boolean");
}

void ConfigVariable::getValue(int &value) {
  throw CPGDumpCtlFailure("runtime variable \"" + this->name + "\" is not an integer");
}

void ConfigVariable::reset() {
  throw CPGDumpCtlFailure("cannot reset default value within base configuration class");
}

/* *****************************************************************************
 * BoolConfigVariable Runtime Variable Implementation
 * ****************************************************************************/

BoolConfigVariable::BoolConfigVariable(string name) {

  this->name = name;

}

BoolConfigVariable::BoolConfigVariable(string name,
                                       bool   value,
                                       bool   defaultval) : BoolConfigVariable(name) {

  this->value = value;
  this->default_value = defaultval;

}

void BoolConfigVariable::reset() {

  this->value = this->default_value;

}

void BoolConfigVariable::setValue(bool value) {

  this->value = value;
  this->call_assign_hook();

}

void BoolConfigVariable::assign(string value) {

  this->setValue(CPGDumpCtlBase::strToBool(value));

}

void BoolConfigVariable::setDefault(bool value) {

  this->default_value = value;

}

void BoolConfigVariable::getValue(bool &value) {
  value = this->value;
}

void BoolConfigVariable::getValue(string &value) {

  (this->value) ? value = "true" : value = "false";

}

/* *****************************************************************************
 * StringConfigVariable Runtime Variable Implementation
 * ****************************************************************************/

StringConfigVariable::StringConfigVariable() {}

StringConfigVariable::StringConfigVariable(string name) : StringConfigVariable() {

  this->name = name;

}

StringConfigVariable::StringConfigVariable(string name,
                                           string value,
                                           string defaultval) : StringConfigVariable(name) {

  this->value = value;
  this->default_value = defaultval;

}

void StringConfigVariable::reset() {

  this->value = this->default_value;

}

void StringConfigVariable::setValue(string value) {

  this->value = value;
  this->call_assign_hook();

}

void StringConfigVariable::assign(string value) {

  this->setValue(value);

}

void StringConfigVariable::setDefault(string defaultval) {

  this->default_value = defaultval;

}

void StringConfigVariable::getValue(string &value) {
  value = this->value;
}

/* *****************************************************************************
 * EnumConfigVariable Runtime Variable Implementation
 * ****************************************************************************/

EnumConfigVariable::EnumConfigVariable(string name) {

  this->name = name;

}

EnumConfigVariable::EnumConfigVariable(string name,
                                       string value,
                                       string defaultval,
                                       std::unordered_set<string> possible_values) : EnumConfigVariable(name) {

  /* IMPORTANT: set allowed values *before* assigning the value */
  this->allowed_values = possible_values;

  this->setDefault(defaultval);
  this->check_value(value);
  this->value = value;

}

void EnumConfigVariable::reset() {

  this->value = this->default_value;

}

void EnumConfigVariable::getValue(string &value) {
  value = this->value;
}

void EnumConfigVariable::check_value(std::string value) {

  unordered_set<string>::const_iterator gotit = this->allowed_values.find(value);

  if (gotit == this->allowed_values.end()) {

    ostringstream oss;

    oss << "invalid value \""
        << value
        << "\" for variable "
        << this->name;

    /* this value is not in the list of allowed values */
    throw CPGDumpCtlFailure(oss.str());

  }

}

void EnumConfigVariable::setValue(string value) {

  /*
   * Before assigning the new value, check if
   * the string is in the list of allowed values.
   */
  this->check_value(value);
  this->value = value;

  this->call_assign_hook();

}

void EnumConfigVariable::assign(string value) {

  this->setValue(value);

}

void EnumConfigVariable::setDefault(string defaultval) {

  this->check_value(defaultval);
  this->default_value = defaultval;

}

/* *****************************************************************************
 * IntegerConfigVariable Runtime Variable Implementation
 * ****************************************************************************/

IntegerConfigVariable::IntegerConfigVariable(string name) {

  this->name = name;

}

IntegerConfigVariable::IntegerConfigVariable(string name,
                                             int value,
                                             int default_value,
                                             int range_min,
                                             int range_max) : IntegerConfigVariable(name) {

  this->setRange(range_min, range_max);
  this->enforce_rangecheck = true;

  this->setDefault(default_value);
  this->setValue(value);

}

void IntegerConfigVariable::getValue(string &value) {

  value = CPGDumpCtlBase::intToStr(this->value);

}

void IntegerConfigVariable::getValue(int &value) {
  value = this->value;
}

void IntegerConfigVariable::reset() {

  this->value = this->default_value;

}

void IntegerConfigVariable::check(int value) {

  if (this->enforce_rangecheck
      && (value > this->max || value < this->min)) {

    ostringstream oss;
    oss << "value "
        << value
        << " for variable "
        << this->name
        << " violates allowed range of values: min="
        << this->min
        << " max="
        << this->max;
    throw CPGDumpCtlFailure(oss.str());

  }

}

void IntegerConfigVariable::setRange(int min, int max) {

  if (max < min)
    throw CPGDumpCtlFailure("max value smaller than min when setting configuration value range");

  this->min = min;
  this->max = max;

}

void IntegerConfigVariable::setValue(int value) {

  this->check(value);
  this->value = value;

  this->call_assign_hook();

}

void IntegerConfigVariable::assign(string value) {

  this->setValue(CPGDumpCtlBase::strToInt(value));

}

void IntegerConfigVariable::setDefault(int defaultval) {

  this->check(defaultval);
  this->default_value = defaultval;

}

/* *****************************************************************************
 * Runtime environment implementation
 * ****************************************************************************/

RuntimeVariableEnvironment::RuntimeVariableEnvironment(shared_ptr<RuntimeConfiguration> rtc) {
  this->runtime_config = rtc;
}

shared_ptr<RuntimeConfiguration> RuntimeVariableEnvironment::createRuntimeConfiguration() {

  shared_ptr<RuntimeConfiguration> rtc = make_shared<RuntimeConfiguration>();
  std::unordered_set<std::string> enums;

  /*
   * Output format
   */
  enums.insert("json");
  enums.insert("console");

  rtc->create("output.format", string("console"), string("console"), enums);
  enums.clear();

  /*
   * The log_level parameter tells pg_dumpctl what to log. The assign
   * hook is attached by the caller, so library users aren't forced
   * to change the global boost::log filter.
   */
  enums.insert("trace");
  enums.insert("debug");
  enums.insert("info");
  enums.insert("warning");
  enums.insert("error");
  enums.insert("fatal");

  rtc->create("logging.level",
#ifdef __DEBUG__
              string("debug"), string("debug"),
#else
              string("info"), string("info"),
#endif
              enums);
  enums.clear();

  /*
   * The on-error-exit bool parameter causes the interactive shell to
   * exit immediately if a command fails.
   */
  rtc->create("interactive.on_error_exit", false, false);

  /*
   * External executables. Plain names are looked up in PATH.
   */
  rtc->create("pg_dump.binary", string("pg_dump"), string("pg_dump"));
  rtc->create("pg_restore.binary", string("pg_restore"), string("pg_restore"));

  rtc->create("restore.no_owner", true, true);
  rtc->create("restore.no_privileges", true, true);

  /*
   * Process supervision. A timeout of 0 disables it, a week is
   * the upper bound.
   */
  rtc->create("process.timeout", 0, 0, 0, 604800);
  rtc->create("process.stderr_tail_kb", 8, 8, 1, 1024);
  rtc->create("process.kill_grace", 5, 5, 0, 300);

  rtc->create("wipe.connect_timeout", 10, 10, 0, 3600);

  /* Empty path disables the operation history */
  rtc->create("history.catalog", string(""), string(""));

  return rtc;

}

/* *****************************************************************************
 * Runtime Configuration Implementation
 * ****************************************************************************/

RuntimeConfiguration::RuntimeConfiguration() {}

RuntimeConfiguration::~RuntimeConfiguration() {}

size_t RuntimeConfiguration::count_variables() {
  return variables.size();
}

std::vector<std::string> RuntimeConfiguration::names() {

  std::vector<std::string> result;

  for (auto const &item : this->variables) {
    result.push_back(item.first);
  }

  std::sort(result.begin(), result.end());
  return result;

}

void RuntimeConfiguration::reset(string name) {

  this->get(name)->reset();

}

shared_ptr<ConfigVariable> RuntimeConfiguration::get(string name) {

  auto it = this->variables.find(name);

  if (it == this->variables.end()) {
    throw CPGDumpCtlFailure("variable does not exist: \"" + name + "\"");
  }

  return it->second;

}

std::string RuntimeConfiguration::getString(std::string name) {

  std::string value;

  this->get(name)->getValue(value);
  return value;

}

int RuntimeConfiguration::getInt(std::string name) {

  int value;

  this->get(name)->getValue(value);
  return value;

}

bool RuntimeConfiguration::getBool(std::string name) {

  bool value;

  this->get(name)->getValue(value);
  return value;

}

std::shared_ptr<ConfigVariable> RuntimeConfiguration::create(string name,
                                                             bool value,
                                                             bool default_value) {
  shared_ptr<ConfigVariable> var = nullptr;

  /*
   * Check if the variable already exists. If true, assign
   * the new value and default_value.
   */
  auto it = this->variables.find(name);

  if (it != this->variables.end()) {

    var = it->second;
    var->setDefault(default_value);
    var->setValue(value);

  } else {

    var = make_shared<BoolConfigVariable>(name, value, default_value);
    this->variables.insert(make_pair(name, var));

  }

  return var;

}

std::shared_ptr<ConfigVariable> RuntimeConfiguration::create(string name, int value, int default_value,
                                                             int range_min, int range_max) {

  shared_ptr<ConfigVariable> var = nullptr;

  auto it = this->variables.find(name);

  if (it != this->variables.end()) {

    var = it->second;
    var->setRange(range_min, range_max);
    var->setDefault(default_value);
    var->setValue(value);

  } else {

    var = make_shared<IntegerConfigVariable>(name, value, default_value, range_min, range_max);
    this->variables.insert(make_pair(name, var));

  }

  return var;

}

std::shared_ptr<ConfigVariable> RuntimeConfiguration::create(string name,
                                                             string value,
                                                             string default_value,
                                                             std::unordered_set<string> possible_values) {

  shared_ptr<ConfigVariable> var = nullptr;

  auto it = this->variables.find(name);

  if (it != this->variables.end()) {

    var = it->second;
    var->setValue(value);

  } else {

    var = make_shared<EnumConfigVariable>(name,
                                          value,
                                          default_value,
                                          possible_values);
    this->variables.insert(make_pair(name, var));

  }

  return var;
}

std::shared_ptr<ConfigVariable> RuntimeConfiguration::create(string name,
                                                             string value,
                                                             string default_value) {

  shared_ptr<ConfigVariable> var = nullptr;

  auto it = this->variables.find(name);

  if (it != this->variables.end()) {

    var = it->second;
    var->setValue(value);

  } else {

    var = make_shared<StringConfigVariable>(name, value, default_value);
    this->variables.insert(make_pair(name, var));
  }

  return var;

}

std::shared_ptr<ConfigVariable> RuntimeConfiguration::assign(std::string name,
                                                             std::string value) {

  shared_ptr<ConfigVariable> var = this->get(name);

  var->assign(value);
  return var;

}

std::shared_ptr<ConfigVariable> RuntimeConfiguration::assign(std::string assignment) {

  std::string::size_type pos = assignment.find('=');

  if (pos == std::string::npos || pos == 0) {
    throw CPGDumpCtlFailure("runtime variable assignment must be of the form name=value: \""
                            + assignment + "\"");
  }

  return this->assign(assignment.substr(0, pos), assignment.substr(pos + 1));

}
