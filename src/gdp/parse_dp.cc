#include <fstream>

#include <boost/make_shared.hpp>
#include <boost/program_options.hpp>

#include "corpus/errors.h"
#include "corpus/model_config.h"
#include "corpus/parsed_corpus.h"
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
        "sentences to parse, conll format")
    ("text", value<bool>()->default_value(false),
        "Input is whitespace tokenized text, one sentence per line.")
    ("test-out-file,o", value<std::string>()->default_value("system.out.conll"),
        "conll output file for the parsed sentences")
    ("model-in", value<std::string>(),
        "Load model from this file")
    ("model-out", value<std::string>(),
        "Write the model to this file")
    ("buckets", value<int>(),
        "number of length buckets (defaults to the model's)")
    ("batch-size", value<int>(),
        "maximum number of padded tokens per batch (defaults to the model's)")
    ("tree", value<bool>(),
        "Decode well-formed trees (defaults to the model's).")
    ("proj", value<bool>(),
        "Decode projective trees, requires tree (defaults to the model's).")
    ("prob", value<bool>(),
        "Compute arc probabilities (defaults to the model's).")
    ("threads", value<int>()->default_value(1),
        "number of worker threads.")
    ("seed", value<int>()->default_value(1),
        "Random seed for parameter initialisation.")
    ("word-representation-size", value<int>()->default_value(100),
        "Width of word representation vectors.")
    ("tag-representation-size", value<int>()->default_value(100),
        "Width of tag representation vectors.")
    ("arc-representation-size", value<int>()->default_value(500),
        "Width of arc scoring layers.")
    ("rel-representation-size", value<int>()->default_value(100),
        "Width of relation scoring layers.")
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

  boost::shared_ptr<ModelConfig> config = boost::make_shared<ModelConfig>();
  if (vm.count("training-set")) {
    config->training_file = vm["training-set"].as<std::string>();
  }
  config->test_file = vm["test-set"].as<std::string>();
  config->test_output_file = vm["test-out-file"].as<std::string>();
  if (vm.count("model-in")) {
    config->model_input_file = vm["model-in"].as<std::string>();
  }
  if (vm.count("model-out")) {
    config->model_output_file = vm["model-out"].as<std::string>();
  }

  config->threads = vm["threads"].as<int>();
  config->seed = vm["seed"].as<int>();
  config->word_representation_size = vm["word-representation-size"].as<int>();
  config->tag_representation_size = vm["tag-representation-size"].as<int>();
  config->arc_representation_size = vm["arc-representation-size"].as<int>();
  config->rel_representation_size = vm["rel-representation-size"].as<int>();
  config->verbose = vm["verbose"].as<bool>();

  try {
    boost::shared_ptr<DependencyParser> parser;
    if (config->model_input_file.size()) {
      parser = DependencyParser::load(config->model_input_file);
    } else if (config->training_file.size()) {
      parser = DependencyParser::create(config);
    } else {
      std::cerr << "Either --model-in or --training-set is required" << std::endl;
      return 1;
    }

    // Command line settings override the stored ones.
    boost::shared_ptr<ModelConfig> model_config = parser->getConfig();
    model_config->test_file = config->test_file;
    model_config->test_output_file = config->test_output_file;
    if (vm.count("buckets")) model_config->buckets = vm["buckets"].as<int>();
    if (vm.count("batch-size"))
      model_config->batch_size = vm["batch-size"].as<int>();
    if (vm.count("tree")) model_config->tree = vm["tree"].as<bool>();
    if (vm.count("proj")) model_config->proj = vm["proj"].as<bool>();
    if (vm.count("prob")) model_config->prob = vm["prob"].as<bool>();
    model_config->threads = config->threads;
    model_config->verbose = config->verbose;
    model_config->validate();

    if (config->model_output_file.size()) {
      parser->save(config->model_output_file);
    }

    boost::shared_ptr<ParsedCorpus> corpus =
        boost::make_shared<ParsedCorpus>(model_config);
    if (vm["text"].as<bool>()) {
      corpus->readTxtFile(model_config->test_file, parser->getDict(), true);
    } else {
      corpus->readFile(model_config->test_file, parser->getDict(), true);
    }
    std::cerr << "Corpus size: " << corpus->size() << " sentences,\t"
              << corpus->numTokens() << " tokens" << std::endl;

    PredictionResult result = parser->predict(corpus);
    std::cerr << "Parsed " << result.size() << " sentences" << std::endl;
  } catch (const ParseError& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
