#include <boost/test/unit_test.hpp>

#include "../core/config/ConfigStore.hpp"
#include <boost/filesystem.hpp>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;
using config::ConfigStore;
namespace fs = boost::filesystem;

struct FixtureConfig {
  FixtureConfig() {
    BOOST_TEST_MESSAGE( "setup fixure" );
    dir_tmp = fs::temp_directory_path() / fs::unique_path("coalescence-%%%%-%%%%");
    fs::create_directories(dir_tmp);
  }
  ~FixtureConfig() {
    BOOST_TEST_MESSAGE( "teardown fixture" );
    fs::remove_all(dir_tmp);
  }

  /** Run the command line parser on a list of arguments (program name is prepended). */
  bool parse(ConfigStore& config, vector<string> args) {
    args.insert(args.begin(), "coalescence");
    vector<char*> argv;
    for (string& arg : args) {
      argv.push_back(&arg[0]);
    }
    return config.parseArgs(int(argv.size()), argv.data());
  }

  string writeConfigFile(const string& content) {
    string filename = (dir_tmp / "config.yml").string();
    ofstream f(filename);
    f << content;
    f.close();
    return filename;
  }

  fs::path dir_tmp;
};

BOOST_FIXTURE_TEST_SUITE( config_store, FixtureConfig )

BOOST_AUTO_TEST_CASE( defaults )
{
  ConfigStore config;
  BOOST_REQUIRE( parse(config, { "-v", "0" }) );
  BOOST_CHECK_EQUAL( config.getValue<long>("samples"), 10 );
  BOOST_CHECK_EQUAL( config.getValue<long>("replicates"), 1 );
  BOOST_CHECK_EQUAL( config.getValue<string>("out-dir"), "output" );
  BOOST_CHECK( config.getValue<bool>("out-dot") );
  BOOST_CHECK( config.getValue<bool>("out-newick") );
  BOOST_CHECK( config.getValue<bool>("out-path") );
  BOOST_CHECK( !config.getValue<bool>("study") );
  BOOST_CHECK_EQUAL( config.getValue<int>("study-max-power"), 10 );
  BOOST_CHECK_EQUAL( config.getValue<int>("verbosity"), 0 );
  BOOST_CHECK_EQUAL( config.threads, 1 );

  vector<size_t> sizes = config.getStudyGroupSizes();
  BOOST_REQUIRE_EQUAL( sizes.size(), 10u );
  BOOST_CHECK_EQUAL( sizes.front(), 2u );
  BOOST_CHECK_EQUAL( sizes.back(), 1024u );
}

BOOST_AUTO_TEST_CASE( command_line )
{
  ConfigStore config;
  BOOST_REQUIRE( parse(config, {
    "-v", "0", "-n", "64", "-r", "5", "-s", "42", "-p", "2", "-o", "results",
    "--study", "--study-max-power", "3", "--out-dot", "false"
  }) );
  BOOST_CHECK_EQUAL( config.getValue<long>("samples"), 64 );
  BOOST_CHECK_EQUAL( config.getValue<long>("replicates"), 5 );
  BOOST_CHECK_EQUAL( config.getValue<long>("seed"), 42 );
  BOOST_CHECK_EQUAL( config.getValue<string>("out-dir"), "results" );
  BOOST_CHECK_EQUAL( config.threads, 2 );
  BOOST_CHECK( config.getValue<bool>("study") );
  BOOST_CHECK( !config.getValue<bool>("out-dot") );
  BOOST_CHECK( config.getValue<bool>("out-newick") );

  vector<size_t> sizes = config.getStudyGroupSizes();
  vector<size_t> expected = { 2, 4, 8 };
  BOOST_CHECK( sizes == expected );
}

/* invalid arguments stop the program */
BOOST_AUTO_TEST_CASE( invalid_arguments )
{
  ConfigStore c1, c2, c3, c4, c5, c6, c7, c8;
  BOOST_CHECK( !parse(c1, { "-v", "0", "-n", "0" }) );
  BOOST_CHECK( !parse(c2, { "-v", "0", "-r", "0" }) );
  BOOST_CHECK( !parse(c3, { "-v", "0", "-p", "0" }) );
  BOOST_CHECK( !parse(c4, { "-v", "0", "--study-max-power", "21" }) );
  BOOST_CHECK( !parse(c5, { "-v", "0", "-n", "many" }) );
  BOOST_CHECK( !parse(c6, { "--no-such-option" }) );
  BOOST_CHECK( !parse(c7, { "--help" }) );
  BOOST_CHECK( !parse(c8, { "-c", (dir_tmp / "missing.yml").string() }) );
}

/* command line values take precedence over config file values */
BOOST_AUTO_TEST_CASE( config_file )
{
  string fn_config = writeConfigFile(
    "samples: 32\n"
    "replicates: 7\n"
    "verbosity: 0\n"
    "out-dir: from_file\n"
    "rate: 1e-3\n"
    "extra:\n"
    "  depth: 3\n"
  );
  ConfigStore config;
  BOOST_REQUIRE( parse(config, { "-c", fn_config, "-r", "9" }) );
  BOOST_CHECK_EQUAL( config.getValue<long>("samples"), 32 );
  BOOST_CHECK_EQUAL( config.getValue<long>("replicates"), 9 );
  BOOST_CHECK_EQUAL( config.getValue<int>("verbosity"), 0 );
  BOOST_CHECK_EQUAL( config.getValue<string>("out-dir"), "from_file" );
  // missing from file and command line: defaults
  BOOST_CHECK_EQUAL( config.getValue<int>("study-max-power"), 10 );
  BOOST_CHECK( config.getValue<bool>("out-path") );

  BOOST_CHECK_CLOSE( config.getValue<double>("rate"), 0.001, 1e-10 );
  BOOST_CHECK_EQUAL( config.getValue<int>("extra:depth"), 3 );
  BOOST_CHECK_EQUAL( config.getValue<int>(string("extra:depth")), 3 );
}

BOOST_AUTO_TEST_CASE( invalid_config_file )
{
  string fn_config = writeConfigFile("samples: [1, 2\n");
  ConfigStore config;
  BOOST_CHECK( !parse(config, { "-v", "0", "-c", fn_config }) );

  string fn_typo = writeConfigFile("samples: lots\nverbosity: 0\n");
  ConfigStore config_typo;
  BOOST_CHECK( !parse(config_typo, { "-c", fn_typo }) );

  // the document root must be a map of parameters
  string fn_scalar = writeConfigFile("just some text\n");
  ConfigStore config_scalar;
  BOOST_CHECK( !parse(config_scalar, { "-c", fn_scalar }) );

  string fn_list = writeConfigFile("- 1\n- 2\n");
  ConfigStore config_list;
  BOOST_CHECK( !parse(config_list, { "-v", "0", "-c", fn_list }) );

  // an empty file leaves the defaults in place
  string fn_empty = writeConfigFile("");
  ConfigStore config_empty;
  BOOST_REQUIRE( parse(config_empty, { "-v", "0", "-c", fn_empty }) );
  BOOST_CHECK_EQUAL( config_empty.getValue<long>("samples"), 10 );

  ConfigStore config_missing;
  BOOST_CHECK_THROW( config_missing.loadFile((dir_tmp / "missing.yml").string()), std::runtime_error );
}

BOOST_AUTO_TEST_CASE( unknown_keys )
{
  ConfigStore config;
  BOOST_REQUIRE( parse(config, { "-v", "0" }) );
  BOOST_CHECK_THROW( config.getValue<int>("no-such-key"), std::out_of_range );
  BOOST_CHECK_THROW( config.getValue<int>("samples:depth"), std::out_of_range );
  BOOST_CHECK_THROW( config.getValue<int>(""), std::invalid_argument );

  config.setValue("no-such-key", 5);
  BOOST_CHECK_EQUAL( config.getValue<int>("no-such-key"), 5 );
}

BOOST_AUTO_TEST_SUITE_END()
