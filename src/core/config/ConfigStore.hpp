#pragma once

#include "../errors.hpp"
#include "../stringio.hpp"

#include <boost/filesystem/path.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include <set>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#define PROGRAM_NAME "PeakMers"

namespace config {

/**
 * Stores user parameters.
 *
 * Parameters are collected from (in order of precedence) the command
 * line, an optional YAML config file (--config) and built-in defaults.
 * YAML keys are the long option names. Values are checked before any
 * processing starts.
 */
class ConfigStore
{
public:
  ConfigStore();

  /** Parse command line arguments of the window preparer.
   * @return true: program can run normally, false: indication to stop (help, version)
   * @throws error::ConfigurationError, error::IOError on invalid parameters
   */
  bool parseArgsWindows(int ac, char* av[]);
  /** Parse command line arguments of the classifier.
   * @return true: program can run normally, false: indication to stop (help, version)
   * @throws error::ConfigurationError, error::IOError on invalid parameters
   */
  bool parseArgsClassify(int ac, char* av[]);

  /** Is a parameter set? Nested keys are separated by ':'. */
  bool hasValue(const std::string& key) const;
  /** Get parameter value. Nested keys are separated by ':'. */
  template<typename T>
    T getValue(const char* key) const;
  template<typename T>
    T getValue(const std::string& key) const;

  /** Chromosome allowlist (empty: no restriction). */
  std::set<std::string> getChromosomes() const;

  /** Load parameters from a YAML string (replaces current parameters). */
  void loadYaml(const std::string& yaml);

private:
  YAML::Node _config;
  /** Directory relative paths in the config file refer to. */
  boost::filesystem::path m_path_conf;

  /** Parse command line; handle help/version and config file. */
  bool
  parseCommandLine (
    int ac,
    char* av[],
    const boost::program_options::options_description& desc,
    boost::program_options::variables_map& var_map
  );

  /** Command line value wins over config file value, config file over default. */
  template<typename T>
    void
    setParam (
      const boost::program_options::variables_map& var_map,
      const char* key,
      const T& value
    );

  /** Make an input path from the config file relative to its directory. */
  void
  resolvePath (
    const boost::program_options::variables_map& var_map,
    const char* key
  );

  /** Fail with error::ConfigurationError if parameter is empty. */
  void requireValue(const char* key) const;
  /** Fail with error::IOError if the file given by a parameter does not exist. */
  void requireFile(const char* key) const;
}; /* class ConfigStore */

bool fileExists(const std::string& filename);

/*--------------------------------*
 * function templates definitions *
 *--------------------------------*/

template<typename T>
T ConfigStore::getValue(const char* key) const {
  std::vector<std::string> keys = stringio::split(std::string(key), ':');
  const YAML::Node& root = _config;
  YAML::Node node;
  try {
    node.reset(root[keys[0]]);
    for (unsigned i=1; i<keys.size() && node; i++) {
      const YAML::Node& parent = node;
      YAML::Node child = parent[keys[i]];
      node.reset(child);
    }
  } catch (const YAML::Exception& e) {
    // scalar nodes cannot be subscripted
    throw error::ConfigurationError(std::string("unknown parameter: '") + key + "'");
  }
  if (!node)
    throw error::ConfigurationError(std::string("unknown parameter: '") + key + "'");
  try {
    return node.as<T>();
  } catch (const YAML::Exception& e) {
    throw error::ConfigurationError(std::string("invalid value for parameter '") + key + "'");
  }
}

template<typename T>
T 
ConfigStore::getValue(const std::string& key) const {
  return getValue<T>(key.c_str());
}

template<typename T>
void
ConfigStore::setParam (
  const boost::program_options::variables_map& var_map,
  const char* key,
  const T& value
) {
  if (var_map.count(key) || !_config[key]) {
    _config[key] = value;
  }
}

} /* namespace config */
