#include <sstream>

#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/MotifPairEngine.hpp"
#include "io/ReportWriter.hpp"
#include "utils/ArgParser.hpp"
#include "utils/Logger.hpp"

int main(int argc, char** argv) {
    Memopair::Config config;

    if (!Memopair::Utils::ArgParser::parse(argc, argv, config)) {
        return 1;  // Parse failed or help printed
    }

    auto& logger = Memopair::Utils::Logger::instance();
    logger.set_log_level(config.log_level);

    try {
        if (!config.log_file.empty()) {
            logger.set_log_file(config.log_file);
        }

        if (!config.validate()) {
            LOG_ERROR("Configuration validation failed.");
            return 1;
        }
        if (config.log_level >= Memopair::LogLevel::LOG_DEBUG) {
            config.print();
        }

        Memopair::Utils::ScopedLogger main_scope("Main Execution");

        Memopair::MotifPairEngine engine(config);

        LOG_INFO("[1] Parsing motif pairs and loading inputs...");
        engine.prepare();

        LOG_INFO("[2] Scanning references for " + std::to_string(engine.specs().size()) + " motif pair(s)...");
        engine.run();

        LOG_INFO("[3] Writing results...");
        Memopair::ReportWriter writer;
        writer.stage_summary(config.output_path, engine.report().rows());
        if (config.write_occurrences()) {
            writer.stage_occurrences(config.occurrences_path, engine.occurrences(), engine.references(),
                                     engine.specs());
        }
        writer.commit();

        const Memopair::StateCounts totals = engine.report().totals();
        std::ostringstream ss;
        ss << "Summary: " << totals.occurrences << " occurrences, "
           << totals.count(Memopair::PairedState::BOTH_MODIFIED) << " both modified, "
           << totals.count(Memopair::PairedState::LOW_COVERAGE) << " low coverage, "
           << totals.count(Memopair::PairedState::NO_CALL) << " without pileup call";
        LOG_INFO(ss.str());

    } catch (const Memopair::InvalidSpecError& e) {
        LOG_ERROR(e.what());
        return 1;
    } catch (const Memopair::MalformedPileupLineError& e) {
        LOG_ERROR(e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
