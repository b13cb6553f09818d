#include "matching/profile_generation.hpp"

#include <utility>

#include "common/logging.hpp"

namespace killwatch {

std::shared_ptr<const ProfileGeneration> buildGeneration(
    const std::vector<SurveillanceProfile> &profiles, uint64_t number)
{
    auto generation = std::make_shared<ProfileGeneration>();
    generation->number = number;
    generation->builtAt = std::chrono::system_clock::now();

    for (const auto &profile : profiles) {
        if (!profile.active) {
            continue;
        }
        ++generation->profilesLoaded;

        CompileResult compiled = FilterCompiler::compile(profile.filterTree);
        if (!compiled.ok()) {
            KWLOG_WARN(QStringLiteral("ProfileGeneration"),
                       QStringLiteral("buildGeneration"),
                       QStringLiteral("profile_compile_failed"),
                       QStringLiteral("invalid_filter_tree"),
                       QStringLiteral("exclude_profile"),
                       ::killwatch::logging::defaultWho(),
                       ::killwatch::logging::currentCorrelationId(),
                       nlohmann::json{{"profileId", profile.id},
                                      {"generation", number},
                                      {"error", compiled.error}});
            generation->failedProfileIds.push_back(profile.id);
            continue;
        }

        CompiledProfile entry;
        entry.id = profile.id;
        entry.name = profile.name;
        entry.index = IndexBuilder::build(compiled.tree);
        entry.tree = std::move(compiled.tree);
        entry.predicate = std::move(compiled.predicate);

        generation->indexes.add(generation->profiles.size(), entry.index);
        generation->profiles.push_back(std::move(entry));
    }
    generation->indexes.finalize();

    const IndexCardinalities cardinalities = generation->indexes.cardinalities();
    KWLOG_INFO(QStringLiteral("ProfileGeneration"),
               QStringLiteral("buildGeneration"),
               QStringLiteral("generation_built"),
               QStringLiteral("profile_reload"),
               QStringLiteral("compile_and_index"),
               ::killwatch::logging::defaultWho(),
               ::killwatch::logging::currentCorrelationId(),
               nlohmann::json{{"generation", number},
                              {"profilesLoaded", generation->profilesLoaded},
                              {"compiled", generation->profiles.size()},
                              {"failed", generation->failedProfileIds.size()},
                              {"indexed", generation->indexes.indexedCount()},
                              {"unindexed", generation->indexes.unindexed().size()},
                              {"tagKeys", cardinalities.tags},
                              {"systemKeys", cardinalities.systems},
                              {"shipKeys", cardinalities.ships},
                              {"iskThresholds", cardinalities.iskThresholds}});
    return generation;
}

} // namespace killwatch
