#include "pianola/core/roll_builder.hpp"

#include <string>
#include <vector>

namespace pianola::core {

RollBuildResult BuildRoll(const Song& song, const std::vector<PartSelector>& selectors,
                          const RollBuildOptions& options) {
  RollBuildResult result;
  result.selection = SelectParts(song, selectors);
  if (!result.selection.ok) {
    result.errors = result.selection.errors;
    return result;
  }

  result.merge_options = MergeOptionsForTiming(song.timing);
  if (options.fudge_ticks.has_value()) {
    result.merge_options.fudge_ticks = options.fudge_ticks.value();
  }
  result.merge = MergeTimeline(result.selection.streams, result.merge_options);
  result.range = ValidateRange(result.merge.timeline);

  std::string error;
  if (!ComputeRollLayout(result.range.timeline, song.timing, options.roll, &result.layout, &error)) {
    result.errors.push_back(error);
    return result;
  }
  result.ok = true;
  return result;
}

}  // namespace pianola::core
