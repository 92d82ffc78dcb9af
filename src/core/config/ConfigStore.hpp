#pragma once

#include "../stringio.hpp"

#include <boost/program_options.hpp>
#include <cstddef>
#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <gitversion/version.h>
#include <yaml-cpp/yaml.h>

#define PROGRAM_NAME "Coalescence"

namespace config {

/** Run parameters, collected from the command line and an optional YAML file.
 *
 *  Command line values take precedence over config file values, which take
 *  precedence over built-in defaults.
 */
class ConfigStore
{
public:
  int threads;

  ConfigStore();
  /** Parse command line arguments.
   *  @return true: program can run normally, false: indication to stop
   */
  bool parseArgs(int ac, char* av[]);
  /** Read parameters from a YAML file (same keys as the long options). */
  void loadFile(const std::string filename);
  /** Group sizes for theory comparison: 2^1, ..., 2^study-max-power. */
  std::vector<std::size_t> getStudyGroupSizes();
  template<typename T>
    T getValue(const char* key);
  template<typename T>
    T getValue(const std::string key);
  template<typename T>
    void setValue(const char* key, const T& value);

private:
  YAML::Node _config;
  /** Store value in config if given on command line or missing from config file. */
  template<typename T>
    void _mergeParam(
      const boost::program_options::variables_map& var_map,
      const char* key,
      const T& value);
  /** Check parameter values, print error messages. */
  bool _checkParams();
  void _printParams();
}; /* class ConfigStore */

bool fileExists(std::string filename);

/*--------------------------------*
 * function templates definitions *
 *--------------------------------*/

/** Keys of nested parameters are separated by ':' (e.g. "study:max-power"). */
template<typename T>
T ConfigStore::getValue(const char* key) {
  std::vector<std::string> keys = stringio::split(std::string(key), ':');
  if (keys.empty()) {
    throw std::invalid_argument("ConfigStore: empty parameter name");
  }
  // walk down nested maps without modifying the config
  const YAML::Node& root = _config;
  std::vector<YAML::Node> nodes;
  nodes.push_back(root[keys[0]]);
  for (unsigned i=1; i<keys.size() && nodes.back().IsDefined() && nodes.back().IsMap(); i++) {
    const YAML::Node& parent = nodes.back();
    YAML::Node child = parent[keys[i]];
    nodes.push_back(child);
  }
  const YAML::Node node = nodes.back();
  if (nodes.size() != keys.size() || !node.IsDefined() || node.IsNull()) {
    fprintf(stderr, "[ERROR] ConfigStore: unknown parameter: '%s'\n", key);
    throw std::out_of_range(std::string("ConfigStore: unknown parameter: ") + key);
  }
  return node.as<T>();
}

/** This specialization can parse numbers in scientific format. */
template<> inline
double ConfigStore::getValue<double>(const char* key) {
  std::string s = getValue<std::string>(key);
  return stringio::strToDub(s);
}

template<typename T>
T ConfigStore::getValue(const std::string key) {
  return getValue<T>(key.c_str());
}

template<typename T>
void ConfigStore::setValue(const char* key, const T& value) {
  _config[key] = value;
}

template<typename T>
void ConfigStore::_mergeParam(
  const boost::program_options::variables_map& var_map,
  const char* key,
  const T& value)
{
  bool on_cmdline = var_map.count(key) && !var_map[key].defaulted();
  if (on_cmdline || !_config[key]) {
    _config[key] = value;
  }
}

} /* namespace config */
