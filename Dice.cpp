#include "Dice.hpp"
#include "CampaignError.hpp"
#include <string>

DiceRoller::DiceRoller(uint32_t seed)
	: engine_(seed)
{
}

int DiceRoller::roll(int sides)
{
	std::lock_guard<std::mutex> lock(mutex_);
	std::uniform_int_distribution<int> dist(1, sides);
	return dist(engine_);
}

RollTape::RollTape(std::vector<int> supplied, DiceRoller* fallback)
	: supplied_(std::move(supplied)), fallback_(fallback)
{
}

int RollTape::next(int sides)
{
	if (sides < 1)
		throw_invalid("Cannot roll a die with " + std::to_string(sides) + " sides.");

	int value = 0;
	if (next_ < supplied_.size()) {
		value = supplied_[next_++];
		if (value < 1 || value > sides) {
			throw_invalid("Roll " + std::to_string(value) + " does not fit a d" + std::to_string(sides) + ".");
		}
	}
	else if (fallback_) {
		value = fallback_->roll(sides);
	}
	else {
		throw_invalid("Not enough rolls supplied.");
	}

	used_.push_back(value);
	return value;
}

int RollTape::sum(int count, int sides)
{
	int total = 0;
	for (int i = 0; i < count; ++i)
		total += next(sides);
	return total;
}
