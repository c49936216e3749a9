#include "ConfigStore.hpp"
#include "version.hpp"

#include <boost/filesystem/operations.hpp>
#include <ctime>
#include <sstream>
#include <sys/stat.h>

using namespace std;
namespace fs = boost::filesystem;
namespace po = boost::program_options;

namespace config {

// default constructor
ConfigStore::ConfigStore()
{
  _config = YAML::Node();
  m_path_conf = fs::current_path();
}

bool
ConfigStore::parseCommandLine (
  int ac,
  char* av[],
  const po::options_description& desc,
  po::variables_map& var_map
) {
  try {
    po::store(po::parse_command_line(ac, av, desc), var_map);
  } catch (const po::error& e) {
    throw error::ConfigurationError(e.what());
  }

  if (var_map.count("version")) {
    std::cout << PROGRAM_NAME << " " << version::VERSION_STRING << endl;
    return false;
  }

  if (var_map.count("help") || ac == 1) {
    std::cout << desc << std::endl;
    return false;
  }

  try {
    po::notify(var_map);  // might throw an error, so call after checking for "help"
  } catch (const po::error& e) {
    throw error::ConfigurationError(e.what());
  }

  // initialize configuration from config file
  if (var_map.count("config")) {
    string fn_config = var_map["config"].as<string>();
    if (!fileExists(fn_config)) {
      throw error::IOError("config file '" + fn_config + "' does not exist");
    }
    try {
      _config = YAML::LoadFile(fn_config);
    } catch (const YAML::Exception& e) {
      throw error::ConfigurationError("could not parse config file '" + fn_config + "': " + e.what());
    }
    if (_config.IsNull())
      _config = YAML::Node(YAML::NodeType::Map);
    if (!_config.IsMap())
      throw error::ConfigurationError("config file '" + fn_config + "' must contain a mapping of parameters");
    // find files relative to config directory
    m_path_conf = fs::absolute(fs::path(fn_config)).parent_path();
  }

  return true;
}

/** Parse command line arguments of the window preparer. */
bool ConfigStore::parseArgsWindows (int ac, char* av[])
{
  // default values
  string fn_peaks = "";
  string fn_genome = "";
  long width = 501;
  vector<string> vec_chr;
  unsigned max_attempts = 1000;
  string pfx_out = "peakmers";
  string fn_treat_win = "";
  string fn_treat_seq = "";
  string fn_ctrl_win = "";
  string fn_ctrl_seq = "";
  int verb = 1;
  long seed = time(NULL) + clock();

  // program description
  stringstream ss;
  ss << endl << PROGRAM_NAME << " " << version::VERSION_STRING << " - window preparation" << endl << endl;
  ss << "Available options";

  po::options_description desc(ss.str());
  desc.add_options()
    ("version", "print version string")
    ("help,h", "print help message")
    ("config,c", po::value<string>(), "config file (YAML)")
    ("peaks,p", po::value<string>(&fn_peaks), "peak file (chrom, start, end, ..., summit offset in column 10)")
    ("genome,g", po::value<string>(&fn_genome), "reference genome (FASTA)")
    ("width,w", po::value<long>(&width), "window width (odd number, default: 501)")
    ("chromosomes", po::value<vector<string>>(&vec_chr)->multitoken(), "only use these chromosomes (space or comma separated)")
    ("max-attempts", po::value<unsigned>(&max_attempts), "draws per control window before giving up (default: 1000)")
    ("out-prefix,o", po::value<string>(&pfx_out), "prefix for output files (default: 'peakmers')")
    ("out-treatment-windows", po::value<string>(&fn_treat_win), "treatment window file (default: <prefix>.treatment.bed)")
    ("out-treatment-seqs", po::value<string>(&fn_treat_seq), "treatment sequence file (default: <prefix>.treatment.fa)")
    ("out-control-windows", po::value<string>(&fn_ctrl_win), "control window file (default: <prefix>.control.bed)")
    ("out-control-seqs", po::value<string>(&fn_ctrl_seq), "control sequence file (default: <prefix>.control.fa)")
    ("verbosity,v", po::value<int>(&verb), "detail level of console output (default: 1)")
    ("seed,s", po::value<long>(&seed), "random seed")
  ;

  po::variables_map var_map;
  if (!parseCommandLine(ac, av, desc, var_map))
    return false;

  // split comma-separated chromosome lists
  vector<string> vec_chr_split;
  for (auto const & item : vec_chr)
    for (auto const & id : stringio::split(item, ','))
      if (id.length() > 0)
        vec_chr_split.push_back(id);

  setParam(var_map, "width", width);
  // window width is checked before anything else
  if (getValue<long>("width") < 1 || getValue<long>("width") % 2 == 0) {
    throw error::ConfigurationError(stringio::format(
      "window width must be a positive odd number (got %ld)", getValue<long>("width")));
  }

  setParam(var_map, "peaks", fn_peaks);
  setParam(var_map, "genome", fn_genome);
  if (var_map.count("chromosomes") || !_config["chromosomes"])
    _config["chromosomes"] = vec_chr_split;
  setParam(var_map, "max-attempts", max_attempts);
  setParam(var_map, "out-prefix", pfx_out);
  pfx_out = getValue<string>("out-prefix");
  setParam(var_map, "out-treatment-windows", fn_treat_win);
  setParam(var_map, "out-treatment-seqs", fn_treat_seq);
  setParam(var_map, "out-control-windows", fn_ctrl_win);
  setParam(var_map, "out-control-seqs", fn_ctrl_seq);
  if (getValue<string>("out-treatment-windows").empty())
    _config["out-treatment-windows"] = pfx_out + ".treatment.bed";
  if (getValue<string>("out-treatment-seqs").empty())
    _config["out-treatment-seqs"] = pfx_out + ".treatment.fa";
  if (getValue<string>("out-control-windows").empty())
    _config["out-control-windows"] = pfx_out + ".control.bed";
  if (getValue<string>("out-control-seqs").empty())
    _config["out-control-seqs"] = pfx_out + ".control.fa";
  setParam(var_map, "verbosity", verb);
  setParam(var_map, "seed", seed);

  //---------------------------------------------------------------------------
  // perform sanity checks
  //---------------------------------------------------------------------------

  if (getValue<unsigned>("max-attempts") == 0)
    throw error::ConfigurationError("parameter 'max-attempts' must be positive");
  requireValue("peaks");
  requireValue("genome");
  resolvePath(var_map, "peaks");
  resolvePath(var_map, "genome");
  requireFile("peaks");
  requireFile("genome");

  return true;
}

/** Parse command line arguments of the classifier. */
bool ConfigStore::parseArgsClassify (int ac, char* av[])
{
  // default values
  string fn_train_treat = "";
  string fn_train_ctrl = "";
  string fn_target_treat = "";
  string fn_target_ctrl = "";
  string fn_out = "predictions.tsv";
  double lambda = 1e-4;
  int threads = 1;
  int n_learners = 10;
  int epochs = 10;
  double eta0 = 0.01;
  double init_scale = 0.01;
  int k_min = 6;
  int k_max = 8;
  int verb = 1;
  long seed = time(NULL) + clock();

  // program description
  stringstream ss;
  ss << endl << PROGRAM_NAME << " " << version::VERSION_STRING << " - classification" << endl << endl;
  ss << "Available options";

  po::options_description desc(ss.str());
  desc.add_options()
    ("version", "print version string")
    ("help,h", "print help message")
    ("config,c", po::value<string>(), "config file (YAML)")
    ("train-treatment", po::value<string>(&fn_train_treat), "training treatment sequences (FASTA)")
    ("train-control", po::value<string>(&fn_train_ctrl), "training control sequences (FASTA)")
    ("target-treatment", po::value<string>(&fn_target_treat), "target treatment sequences (FASTA)")
    ("target-control", po::value<string>(&fn_target_ctrl), "target control sequences (FASTA)")
    ("output,o", po::value<string>(&fn_out), "prediction output file (default: 'predictions.tsv')")
    ("lambda,l", po::value<double>(&lambda), "L2 regularization weight (default: 1e-4)")
    ("threads,p", po::value<int>(&threads), "number of parallel threads (default: 1)")
    ("ensemble-size,m", po::value<int>(&n_learners), "number of classifiers in ensemble (default: 10)")
    ("epochs,e", po::value<int>(&epochs), "passes over training data per classifier (default: 10)")
    ("learning-rate", po::value<double>(&eta0), "initial SGD learning rate (default: 0.01)")
    ("init-scale", po::value<double>(&init_scale), "range of random initial weights (default: 0.01)")
    ("kmin", po::value<int>(&k_min), "shortest k-mer length (default: 6)")
    ("kmax", po::value<int>(&k_max), "longest k-mer length (default: 8)")
    ("verbosity,v", po::value<int>(&verb), "detail level of console output (default: 1)")
    ("seed,s", po::value<long>(&seed), "random seed")
  ;

  po::variables_map var_map;
  if (!parseCommandLine(ac, av, desc, var_map))
    return false;

  setParam(var_map, "train-treatment", fn_train_treat);
  setParam(var_map, "train-control", fn_train_ctrl);
  setParam(var_map, "target-treatment", fn_target_treat);
  setParam(var_map, "target-control", fn_target_ctrl);
  setParam(var_map, "output", fn_out);
  setParam(var_map, "lambda", lambda);
  setParam(var_map, "threads", threads);
  setParam(var_map, "ensemble-size", n_learners);
  setParam(var_map, "epochs", epochs);
  setParam(var_map, "learning-rate", eta0);
  setParam(var_map, "init-scale", init_scale);
  setParam(var_map, "kmin", k_min);
  setParam(var_map, "kmax", k_max);
  setParam(var_map, "verbosity", verb);
  setParam(var_map, "seed", seed);

  //---------------------------------------------------------------------------
  // perform sanity checks
  //---------------------------------------------------------------------------

  if (getValue<double>("lambda") < 0)
    throw error::ConfigurationError("parameter 'lambda' must not be negative");
  if (getValue<int>("threads") < 1)
    throw error::ConfigurationError("parameter 'threads' must be positive");
  if (getValue<int>("ensemble-size") < 1)
    throw error::ConfigurationError("parameter 'ensemble-size' must be positive");
  if (getValue<int>("epochs") < 1)
    throw error::ConfigurationError("parameter 'epochs' must be positive");
  if (getValue<double>("learning-rate") <= 0)
    throw error::ConfigurationError("parameter 'learning-rate' must be positive");
  if (getValue<double>("init-scale") < 0)
    throw error::ConfigurationError("parameter 'init-scale' must not be negative");
  if (getValue<int>("kmin") < 1 || getValue<int>("kmax") < getValue<int>("kmin"))
    throw error::ConfigurationError(stringio::format(
      "invalid k-mer length range [%d, %d]", getValue<int>("kmin"), getValue<int>("kmax")));
  requireValue("output");

  const char* inputs[] = { "train-treatment", "train-control", "target-treatment", "target-control" };
  for (const char* key : inputs) {
    requireValue(key);
    resolvePath(var_map, key);
    requireFile(key);
  }

  return true;
}

bool
ConfigStore::hasValue(const string& key) const {
  try {
    getValue<YAML::Node>(key);
  } catch (const error::ConfigurationError& e) {
    return false;
  }
  return true;
}

set<string>
ConfigStore::getChromosomes() const {
  set<string> res;
  if (!hasValue("chromosomes"))
    return res;
  for (auto const & id : getValue<vector<string>>("chromosomes"))
    res.insert(id);
  return res;
}

void
ConfigStore::loadYaml(const string& yaml) {
  _config = YAML::Load(yaml);
}

void
ConfigStore::resolvePath (
  const po::variables_map& var_map,
  const char* key
) {
  // paths given on the command line are taken as they are
  if (var_map.count(key))
    return;
  fs::path p(getValue<string>(key));
  if (p.is_relative())
    _config[key] = (m_path_conf / p).string();
}

void
ConfigStore::requireValue(const char* key) const {
  if (!hasValue(key) || getValue<string>(key).empty())
    throw error::ConfigurationError(stringio::format("parameter '%s' is required", key));
}

void
ConfigStore::requireFile(const char* key) const {
  string fn = getValue<string>(key);
  if (!fileExists(fn))
    throw error::IOError(stringio::format("file '%s' (parameter '%s') does not exist", fn.c_str(), key));
}

bool fileExists(const string& filename) {
  struct stat buffer;
  return (stat(filename.c_str(), &buffer) == 0);
}

} /* namespace config */
