// File: Dice.hpp
// Description: Random input for the rules. Nothing in the engine rolls on
// its own; every resolution call pulls die results from a RollTape that the
// caller hands in.
#pragma once

#include <vector>
#include <mutex>
#include <random>
#include <cstdint>

// Server-side roller used when a client does not supply its own rolls
class DiceRoller
{
	std::mt19937 engine_;
	std::mutex mutex_;

public:
	explicit DiceRoller(uint32_t seed);

	int roll(int sides);
};

/**
 * @brief An ordered list of die results consumed front to back.
 *
 * Supplied values must fit the die being rolled (1..sides) or the call is
 * rejected with a ValidationError. Once the supplied values run out the
 * fallback roller is used; without one the tape throws.
 */
class RollTape
{
	std::vector<int> supplied_;
	std::size_t next_ = 0;
	DiceRoller* fallback_ = nullptr;
	std::vector<int> used_;

public:
	RollTape() = default;
	explicit RollTape(std::vector<int> supplied, DiceRoller* fallback = nullptr);

	int next(int sides);
	int sum(int count, int sides);

	// Everything handed out so far, for the action log
	const std::vector<int>& used() const { return used_; }
	bool exhausted() const { return next_ >= supplied_.size(); }
};
