#include "cascade/speaker_grouping.h"
#include <set>

namespace cascade {

std::vector<SpeakerGroup> group_by_speaker(const std::vector<Sentence>& sentences) {
    std::vector<SpeakerGroup> groups;

    for (const auto& sentence : sentences) {
        if (groups.empty() || groups.back().speaker != sentence.speaker) {
            SpeakerGroup group;
            group.speaker = sentence.speaker;
            group.start = sentence.start;
            group.end = sentence.end;
            group.text = sentence.text;
            group.members.push_back(sentence);
            groups.push_back(std::move(group));
        } else {
            SpeakerGroup& group = groups.back();
            group.end = sentence.end;
            group.text += sentence.text;
            group.members.push_back(sentence);
        }
    }

    return groups;
}

size_t count_speakers(const std::vector<Sentence>& sentences) {
    std::set<int> speakers;
    for (const auto& sentence : sentences) {
        speakers.insert(sentence.speaker);
    }
    return speakers.size();
}

} // namespace cascade
