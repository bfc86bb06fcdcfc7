#pragma once

#include <string>
#include <vector>
#include "core/trick_segmenter.hpp"

/**
 * @brief Rule-based maneuver model over pose features
 *
 * Airborne runs of at least three frames score as a grab, a 180, a 360 or a
 * straight jump depending on hand position and shoulder rotation. Grounded
 * windows with a wide board-angle range score as carving. Every other frame
 * scores as straight riding.
 */
class HeuristicTrickModel : public TrickModel
{
public:
    FrameLabelScores predict(const std::vector<PoseFrame> &series) override;

    static const std::vector<std::string> &trickClasses();
};
