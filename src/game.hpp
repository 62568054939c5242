#pragma once

#include "main.hpp"
#include "config.hpp"
#include "slicer.hpp"
#include "session.hpp"
#include "interaction.hpp"

#include <chrono>
#include <cstdint>
#include <optional>

#include <opencv2/opencv.hpp>


class Game {
public:
    using Clock = std::chrono::steady_clock;

    Game(const cv::Mat& source, GridSize grid, GameMode mode, const Config& config, uint64_t seed = static_cast<uint64_t>(cv::getTickCount()));

public:
    // Returns true when the pointer release placed a piece
    bool handle_pointer(const PointerEvent& event);

    // Returns false when the player asked to quit
    bool handle_action(GameAction action);

    void start(Clock::time_point now);
    void tick(Clock::time_point now);
    void new_game(Clock::time_point now);

    FrameSnapshot snapshot() const;

    const Session& session() const { return state; }
    Session& session() { return state; }
    const Interaction& interaction() const { return drag; }
    const ScreenLayout& layout() const { return screen; }

    std::optional<double> time_limit() const;
    std::optional<int> move_limit() const;

private:
    void enforce_limits();

    const Config config;
    ScreenLayout screen;
    SlicedImage sliced;
    cv::Mat preview;

    Session state;
    Interaction drag;
    cv::RNG rng;

    Clock::time_point started;
};
