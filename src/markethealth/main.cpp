#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include <boost/algorithm/string.hpp>
#include "number.h"
#include "PriceSeriesCsvReader.h"
#include "AnalysisConfigurationFileReader.h"
#include "MarketBreadthAnalyzer.h"
#include "ComparisonAggregator.h"
#include "ParallelExecutors.h"
#include "NarrativeSummary.h"
#include "ReportWriters.h"
#include "OutputUtils.h"

namespace po = boost::program_options;
using namespace mkc_markethealth;
using Num = num::DefaultNumber;
using SeriesPtr = std::shared_ptr<const PriceSeries<Num>>;

namespace
{
  void printUsage(const po::options_description& desc)
  {
    std::cout << "MarketHealth - distribution day pressure and Trend Guard backtests\n\n";
    std::cout << "Usage: markethealth <distribution|trendguard> --input [SYMBOL=]file.csv ... [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Distribution days for one index as of a date\n";
    std::cout << "  markethealth distribution --input SPY=data/SPY.csv --as-of 2024-04-19\n\n";
    std::cout << "  # Breadth over several indices with a custom configuration\n";
    std::cout << "  markethealth distribution --input data/SPY.csv --input data/QQQ.csv --config mh.csv\n\n";
    std::cout << "  # Trend Guard comparison sorted by drawdown reduction\n";
    std::cout << "  markethealth trendguard --input data/SPY.csv --input data/EFA.csv --sort drawdown\n\n";
    std::cout << "Configuration parameters (for --config files and --set):\n ";
    for (const auto& name : AnalysisConfigurationFileReader::getKnownParameters())
      std::cout << " " << name;
    std::cout << std::endl;
  }

  std::unique_ptr<concurrency::IParallelExecutor> createExecutor(const std::string& name)
  {
    if (boost::algorithm::iequals(name, "single"))
      return std::make_unique<concurrency::SingleThreadExecutor>();

    if (boost::algorithm::iequals(name, "async"))
      return std::make_unique<concurrency::StdAsyncExecutor>();

    if (boost::algorithm::iequals(name, "pool"))
      return std::make_unique<concurrency::ThreadPoolExecutor<>>();

    throw ConfigurationException("Unknown executor '" + name + "' (expected single, async or pool)");
  }

  ComparisonSortKey parseSortKey(const std::string& name)
  {
    for (auto key : { ComparisonSortKey::INPUT_ORDER, ComparisonSortKey::DRAWDOWN_REDUCTION,
		      ComparisonSortKey::CAGR_DELTA, ComparisonSortKey::SHARPE_DELTA })
      if (boost::algorithm::iequals(name, toString(key)))
	return key;

    throw ConfigurationException("Unknown sort key '" + name + "' (expected input, drawdown, cagr or sharpe)");
  }

  // Loads every input. A file that cannot be read is reported and skipped
  // so the remaining symbols are still analysed.
  std::vector<SeriesPtr> loadUniverse(const std::vector<std::string>& inputs, std::ostream& out, bool verbose)
  {
    std::vector<SeriesPtr> universe;

    for (const auto& input : inputs)
      {
	std::string symbol, fileName;
	const std::string::size_type pos = input.find('=');
	if (pos == std::string::npos)
	  {
	    fileName = input;
	    symbol = markethealth::utils::symbolFromFileName(input);
	  }
	else
	  {
	    symbol = input.substr(0, pos);
	    fileName = input.substr(pos + 1);
	  }

	try
	  {
	    PriceSeriesCsvReader<Num> reader(fileName, symbol, verbose ? &out : nullptr);
	    reader.readFile();
	    universe.push_back(reader.getTimeSeries());

	    if (verbose)
	      out << "Loaded " << symbol << ": " << reader.getTimeSeries()->getNumEntries()
		  << " sessions from " << fileName << std::endl;
	  }
	catch (const std::exception& e)
	  {
	    std::cerr << "Warning: skipping " << symbol << ": " << e.what() << std::endl;
	  }
      }

    return universe;
  }

  void runDistribution(const std::vector<SeriesPtr>& universe,
		       const AnalysisConfiguration& config,
		       concurrency::IParallelExecutor& executor,
		       const po::variables_map& vm,
		       std::ostream& out)
  {
    std::optional<TimeSeriesDate> asOf;
    if (vm.count("as-of"))
      asOf = parseSeriesDate(vm["as-of"].as<std::string>());

    DistributionAnalyzer<Num> analyzer(config.getDistributionDayConfiguration(),
				       config.getMarketConditionThresholds(),
				       config.getTechnicalIndicatorConfiguration());
    MarketBreadthAnalyzer<Num> breadth(analyzer, executor);
    BreadthSummary<Num> summary = breadth.analyze(universe, asOf, &out);

    for (const auto& row : summary.getRows())
      if (row.succeeded())
	{
	  out << std::endl;
	  reporting::writeDistributionReport(out, *row.getAnalysis());
	}

    if (summary.getRows().size() > 1)
      reporting::writeBreadthSummary(out, summary);

    if (vm.count("csv"))
      {
	auto file = markethealth::utils::openOutputFile(vm["csv"].as<std::string>());
	for (const auto& row : summary.getRows())
	  if (row.succeeded())
	    reporting::writeDistributionDaysCsv(*file, row.getAnalysis()->getRecords());
      }

    if (vm.count("summary"))
      {
	auto file = markethealth::utils::openOutputFile(vm["summary"].as<std::string>());
	for (const auto& row : summary.getRows())
	  if (row.succeeded())
	    {
	      reporting::NarrativeSummary narrative = reporting::buildDistributionNarrative(*row.getAnalysis());
	      if (vm.count("image"))
		narrative.setImageArtifact(vm["image"].as<std::string>());
	      reporting::writeNarrativeSummary(*file, narrative);
	      *file << "\n";
	    }
      }
  }

  void runTrendGuard(const std::vector<SeriesPtr>& universe,
		     const AnalysisConfiguration& config,
		     concurrency::IParallelExecutor& executor,
		     const po::variables_map& vm,
		     std::ostream& out)
  {
    const ComparisonSortKey sortKey = parseSortKey(vm["sort"].as<std::string>());

    ComparisonAggregator<Num> aggregator(config.getTrendGuardConfiguration(), executor);
    std::vector<ComparisonRow<Num>> rows = aggregator.compare(universe, sortKey, &out);

    reporting::writeComparisonTable(out, rows);

    if (vm.count("csv"))
      {
	auto file = markethealth::utils::openOutputFile(vm["csv"].as<std::string>());
	reporting::writeComparisonCsv(*file, rows);
      }

    if (vm.count("monthly-csv"))
      {
	auto file = markethealth::utils::openOutputFile(vm["monthly-csv"].as<std::string>());
	for (const auto& row : rows)
	  if (row.succeeded())
	    {
	      *file << "# " << row.getSymbol() << "\n";
	      reporting::writeMonthlyObservationsCsv(*file, *row.getResult());
	    }
      }

    if (vm.count("summary"))
      {
	auto file = markethealth::utils::openOutputFile(vm["summary"].as<std::string>());
	for (const auto& row : rows)
	  if (row.succeeded())
	    {
	      reporting::NarrativeSummary narrative = reporting::buildTrendGuardNarrative(row);
	      if (vm.count("image"))
		narrative.setImageArtifact(vm["image"].as<std::string>());
	      reporting::writeNarrativeSummary(*file, narrative);
	      *file << "\n";
	    }
      }
  }
}

int main(int argc, char* argv[])
{
  try
    {
      po::options_description desc("Options");
      desc.add_options()
	("help,h", "Show help message")
	("command", po::value<std::string>(), "distribution or trendguard")
	("input,i", po::value<std::vector<std::string>>()->composing(),
	 "Daily price CSV with Date, Close and Volume columns, optionally prefixed SYMBOL=")
	("config,c", po::value<std::string>(), "Parameter,Value CSV configuration file")
	("set", po::value<std::vector<std::string>>()->composing(),
	 "Override one configuration parameter: name=value")
	("as-of", po::value<std::string>(), "Distribution: as-of date (YYYY-MM-DD), default last session")
	("sort", po::value<std::string>()->default_value("input"),
	 "Trend Guard: row order (input, drawdown, cagr, sharpe)")
	("executor", po::value<std::string>()->default_value("pool"), "single, async or pool")
	("csv", po::value<std::string>(), "Write distribution days or comparison rows as CSV")
	("monthly-csv", po::value<std::string>(), "Trend Guard: write monthly observations and equity")
	("summary", po::value<std::string>(), "Write the key=value narrative summary")
	("image", po::value<std::string>(), "Chart image path attached to the narrative summary")
	("log", po::value<std::string>(), "Mirror console output into this file")
	("verbose,v", "Verbose output");

      po::positional_options_description positional;
      positional.add("command", 1);

      po::variables_map vm;
      po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
      po::notify(vm);

      if (vm.count("help") || !vm.count("command"))
	{
	  printUsage(desc);
	  return vm.count("help") ? 0 : 1;
	}

      const std::string command = boost::algorithm::to_lower_copy(vm["command"].as<std::string>());
      if (command != "distribution" && command != "trendguard")
	{
	  std::cerr << "Error: unknown command '" << command << "'" << std::endl;
	  printUsage(desc);
	  return 1;
	}

      if (!vm.count("input"))
	{
	  std::cerr << "Error: at least one --input file is required" << std::endl;
	  return 1;
	}

      std::unique_ptr<std::ofstream> logFile;
      std::unique_ptr<markethealth::utils::TeeStream> tee;
      if (vm.count("log"))
	{
	  logFile = markethealth::utils::openOutputFile(vm["log"].as<std::string>());
	  tee = std::make_unique<markethealth::utils::TeeStream>(std::cout, *logFile);
	}
      std::ostream& out = tee ? static_cast<std::ostream&>(*tee) : std::cout;
      const bool verbose = vm.count("verbose") > 0;

      AnalysisConfiguration config;
      if (vm.count("config"))
	{
	  AnalysisConfigurationFileReader reader(vm["config"].as<std::string>());
	  config = reader.readConfigurationFile();
	  if (verbose)
	    out << "Configuration read from " << reader.getFileName() << std::endl;
	}

      if (vm.count("set"))
	{
	  ParameterList overrides;
	  for (const auto& assignment : vm["set"].as<std::vector<std::string>>())
	    overrides.push_back(AnalysisConfigurationFileReader::parseAssignment(assignment));

	  config = AnalysisConfigurationFileReader::applyParameters(overrides, config);
	}

      std::vector<SeriesPtr> universe = loadUniverse(vm["input"].as<std::vector<std::string>>(), out, verbose);
      if (universe.empty())
	{
	  std::cerr << "Error: no input could be loaded" << std::endl;
	  return 1;
	}

      auto executor = createExecutor(vm["executor"].as<std::string>());

      if (command == "distribution")
	runDistribution(universe, config, *executor, vm, out);
      else
	runTrendGuard(universe, config, *executor, vm, out);

      out.flush();
      return 0;
    }
  catch (const std::exception& e)
    {
      std::cerr << "Error: " << e.what() << std::endl;
      return 1;
    }
}
