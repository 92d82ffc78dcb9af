#include "ConfigStore.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <ctime>
#include <sstream>
#include <sys/stat.h>

using namespace std;
namespace fs = boost::filesystem;

namespace config {

// default constructor
ConfigStore::ConfigStore() : threads(1)
{
  _config = YAML::Node();
}

void ConfigStore::loadFile(const string filename) {
  if (!fileExists(filename)) {
    throw runtime_error("File '" + filename + "' does not exist.");
  }
  _config = YAML::LoadFile(filename);
}

bool ConfigStore::parseArgs (int ac, char* av[])
{
  // default values
  long n_samples = 10;
  long n_replicates = 1;
  long seed = time(NULL) + clock();
  string dir_out = "output";
  string fn_config = "";
  bool out_dot = true;
  bool out_newick = true;
  bool out_path = true;
  bool do_study = false;
  int study_max_power = 10;
  int verb = 1;

  // program description
  stringstream ss;
  ss << endl << PROGRAM_NAME << " " << version::GIT_TAG_NAME << endl << endl;
  ss << "Available options";

  namespace po = boost::program_options;

  po::options_description desc(ss.str());
  desc.add_options()
    ("version", "print version string")
    ("help,h", "print help message")
    ("config,c", po::value<string>(&fn_config), "config file (YAML)")
    ("samples,n", po::value<long>(&n_samples), "number of individuals in the sample (group size)")
    ("replicates,r", po::value<long>(&n_replicates), "number of independent genealogies")
    ("out-dir,o", po::value<string>(&dir_out), "output directory")
    ("out-dot", po::value<bool>(&out_dot), "write ancestry graph (DOT format)")
    ("out-newick", po::value<bool>(&out_newick), "write genealogy (Newick format)")
    ("out-path", po::value<bool>(&out_path), "write lineage counts and trajectories (CSV)")
    ("study", po::bool_switch(&do_study), "compare replicate statistics with theoretical expectations")
    ("study-max-power", po::value<int>(&study_max_power), "study group sizes 2^1..2^p")
    ("verbosity,v", po::value<int>(&verb), "detail level of console output")
    ("threads,p", po::value<int>(&threads)->default_value(1), "number of parallel threads")
    ("seed,s", po::value<long>(&seed), "random seed")
  ;

  po::variables_map var_map;

  try {
    po::store(po::parse_command_line(ac, av, desc), var_map);

    if (var_map.count("version")) {
      std::cerr << PROGRAM_NAME << " " << version::GIT_TAG_NAME << endl;
      return false;
    }

    if (var_map.count("help")) {
      std::cerr << desc << std::endl;
      return false;
    }

    po::notify(var_map);  // might throw an error, so call after checking for "help"
  }
  catch (std::exception &e) {
    std::cerr << std::endl << "ArgumentError: " << e.what() << std::endl;
    std::cerr << desc << std::endl;
    return false;
  }

  // check: config file exists
  if (fn_config.length() > 0) {
    fs::path path_conf( fn_config );
    if ( path_conf.is_relative() ) {
      path_conf = fs::system_complete( path_conf );
    }
    if (!fileExists(path_conf.string())) {
      fprintf(stderr, "\nArgumentError: File '%s' does not exist.\n", fn_config.c_str());
      return false;
    }
    // initialize global configuration from config file
    try {
      loadFile(path_conf.string());
    }
    catch (const YAML::Exception& e) {
      fprintf(stderr, "\nArgumentError: Could not read config file '%s': %s\n", fn_config.c_str(), e.what());
      return false;
    }
    // an empty file is fine, anything else must map keys to values
    if (!_config.IsNull() && !_config.IsMap()) {
      fprintf(stderr, "\nArgumentError: Config file '%s' must contain 'key: value' pairs.\n", fn_config.c_str());
      return false;
    }
  }

  // overwrite/set config params
  // (making sure parameters are set)
  try {
    _mergeParam(var_map, "samples", n_samples);
    _mergeParam(var_map, "replicates", n_replicates);
    _mergeParam(var_map, "out-dir", dir_out);
    _mergeParam(var_map, "out-dot", out_dot);
    _mergeParam(var_map, "out-newick", out_newick);
    _mergeParam(var_map, "out-path", out_path);
    _mergeParam(var_map, "study", do_study);
    _mergeParam(var_map, "study-max-power", study_max_power);
    _mergeParam(var_map, "verbosity", verb);
    _mergeParam(var_map, "threads", threads);
    _mergeParam(var_map, "seed", seed);

    if (!_checkParams()) {
      return false;
    }
  }
  catch (const YAML::Exception& e) {
    fprintf(stderr, "\nArgumentError: Invalid parameter value: %s\n", e.what());
    return false;
  }
  threads = getValue<int>("threads");

  if (getValue<int>("verbosity") > 0) {
    _printParams();
  }

  return true;
}

bool ConfigStore::_checkParams() {
  if (getValue<long>("samples") < 1) {
    fprintf(stderr, "\nArgumentError: Number of samples must be at least 1 (got %ld).\n", getValue<long>("samples"));
    return false;
  }
  if (getValue<long>("replicates") < 1) {
    fprintf(stderr, "\nArgumentError: Number of replicates must be at least 1 (got %ld).\n", getValue<long>("replicates"));
    return false;
  }
  if (getValue<int>("threads") < 1) {
    fprintf(stderr, "\nArgumentError: Number of threads must be at least 1 (got %d).\n", getValue<int>("threads"));
    return false;
  }
  int p = getValue<int>("study-max-power");
  if (p < 1 || p > 20) {
    fprintf(stderr, "\nArgumentError: Parameter 'study-max-power' must be in [1, 20] (got %d).\n", p);
    return false;
  }
  if (getValue<string>("out-dir").size() == 0) {
    fprintf(stderr, "\nArgumentError: Parameter 'out-dir' must not be empty.\n");
    return false;
  }
  // force type checks of the remaining parameters
  getValue<bool>("out-dot");
  getValue<bool>("out-newick");
  getValue<bool>("out-path");
  getValue<bool>("study");
  getValue<long>("seed");
  getValue<int>("verbosity");

  return true;
}

void ConfigStore::_printParams() {
  fprintf(stderr, "################################################################################\n");
  fprintf(stderr, "%s %s\n", PROGRAM_NAME, version::GIT_TAG_NAME);
  fprintf(stderr, "================================================================================\n");
  fprintf(stderr, "Running with the following options:\n");
  fprintf(stderr, "================================================================================\n");
  fprintf(stderr, "  random seed:\t\t%ld\n", getValue<long>("seed"));
  fprintf(stderr, "  threads:\t\t%d\n", getValue<int>("threads"));
  fprintf(stderr, "  output directory:\t%s\n", getValue<string>("out-dir").c_str());
  fprintf(stderr, "--------------------------------------------------------------------------------\n");
  if (getValue<bool>("study")) {
    fprintf(stderr, "Theory comparison:\n");
    fprintf(stderr, "--------------------------------------------------------------------------------\n");
    fprintf(stderr, "  group sizes:\t\t%s\n", stringio::join(getStudyGroupSizes()).c_str());
    fprintf(stderr, "  replicates:\t\t%ld\n", getValue<long>("replicates"));
  } else {
    fprintf(stderr, "Genealogies:\n");
    fprintf(stderr, "--------------------------------------------------------------------------------\n");
    fprintf(stderr, "  samples:\t\t%ld\n", getValue<long>("samples"));
    fprintf(stderr, "  replicates:\t\t%ld\n", getValue<long>("replicates"));
    fprintf(stderr, "  DOT output:\t\t%s\n", getValue<bool>("out-dot") ? "yes" : "no");
    fprintf(stderr, "  Newick output:\t%s\n", getValue<bool>("out-newick") ? "yes" : "no");
    fprintf(stderr, "  path output:\t\t%s\n", getValue<bool>("out-path") ? "yes" : "no");
  }
  fprintf(stderr, "################################################################################\n");
}

vector<size_t> ConfigStore::getStudyGroupSizes() {
  int p = getValue<int>("study-max-power");
  vector<size_t> group_sizes;
  for (int i=1; i<=p; i++) {
    group_sizes.push_back(size_t(1) << i);
  }
  return group_sizes;
}

bool fileExists(string filename) {
  struct stat buffer;
  if (stat(filename.c_str(), &buffer)!=0) {
    return false;
  }
  return true;
}

} /* namespace config */
