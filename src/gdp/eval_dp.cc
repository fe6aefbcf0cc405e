#include <fstream>

#include <boost/make_shared.hpp>
#include <boost/program_options.hpp>

#include "corpus/errors.h"
#include "corpus/model_config.h"
#include "gdp/dependency_parser.h"

using namespace boost::program_options;
using namespace arcdp;

int main(int argc, char** argv) {
  options_description cmdline_specific("Command line specific options");
  cmdline_specific.add_options()
    ("help,h", "print help message")
    ("config,c", value<std::string>(),
        "Config file specifying additional command line options");

  options_description generic("Allowed options");
  generic.add_options()
    ("training-set,i", value<std::string>(),
        "corpus of parsed sentences used to build the vocabularies, conll format")
    ("test-set,t", value<std::string>(),
        "corpus of gold parsed sentences, conll format")
    ("model-in", value<std::string>(),
        "Load model from this file")
    ("buckets", value<int>(),
        "number of length buckets (defaults to the model's)")
    ("batch-size", value<int>(),
        "maximum number of padded tokens per batch (defaults to the model's)")
    ("tree", value<bool>(),
        "Decode well-formed trees (defaults to the model's).")
    ("proj", value<bool>(),
        "Decode projective trees (defaults to the model's).")
    ("punct", value<bool>(),
        "Score punctuation tokens (defaults to the model's).")
    ("threads", value<int>()->default_value(1),
        "number of worker threads.")
    ("seed", value<int>()->default_value(1),
        "Random seed for parameter initialisation.")
    ("verbose", value<bool>()->default_value(true),
        "Print progress information.");
  options_description config_options, cmdline_options;
  config_options.add(generic);
  cmdline_options.add(generic).add(cmdline_specific);

  variables_map vm;
  try {
    store(parse_command_line(argc, argv, cmdline_options), vm);
    if (vm.count("config") > 0) {
      std::ifstream config(vm["config"].as<std::string>().c_str());
      store(parse_config_file(config, config_options), vm);
    }
    notify(vm);
  } catch (const error& e) {
    std::cerr << e.what() << std::endl << cmdline_options << std::endl;
    return 1;
  }

  if (vm.count("help") || !vm.count("test-set")) {
    std::cerr << cmdline_options << "\n";
    return 1;
  }

  try {
    boost::shared_ptr<DependencyParser> parser;
    if (vm.count("model-in")) {
      parser = DependencyParser::load(vm["model-in"].as<std::string>());
    } else if (vm.count("training-set")) {
      boost::shared_ptr<ModelConfig> config = boost::make_shared<ModelConfig>();
      config->training_file = vm["training-set"].as<std::string>();
      config->seed = vm["seed"].as<int>();
      parser = DependencyParser::create(config);
    } else {
      std::cerr << "Either --model-in or --training-set is required" << std::endl;
      return 1;
    }

    // Command line settings override the stored ones.
    boost::shared_ptr<ModelConfig> config = parser->getConfig();
    config->test_file = vm["test-set"].as<std::string>();
    if (vm.count("buckets")) config->buckets = vm["buckets"].as<int>();
    if (vm.count("batch-size")) config->batch_size = vm["batch-size"].as<int>();
    if (vm.count("tree")) config->tree = vm["tree"].as<bool>();
    if (vm.count("proj")) config->proj = vm["proj"].as<bool>();
    if (vm.count("punct")) config->punct = vm["punct"].as<bool>();
    config->threads = vm["threads"].as<int>();
    config->verbose = vm["verbose"].as<bool>();

    std::pair<Real, AttachmentMetric> result = parser->evaluate(config->test_file);
    std::cerr << "Loss: " << result.first << std::endl;
    result.second.printAccuracy();
  } catch (const ParseError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
