#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <sstream>
#include "Solver.h"

unsigned int checksumWeight(size_t index)
{
	return index % 2 ? 3 : 1;
}

unsigned int checkDigit(const Ean13& code)
{
	unsigned int sum = 0;
	for (size_t i = 0; i < 12; i++)
		sum += checksumWeight(i) * code[i];
	return (10 - sum % 10) % 10;
}

bool verifyChecksum(const Ean13& code)
{
	unsigned int sum = 0;
	for (size_t i = 0; i < code.size(); i++)
		sum += checksumWeight(i) * code[i];
	return sum % 10 == 0;
}

std::string toString(const Ean13& code)
{
	std::stringstream ss;
	for (size_t i = 0; i < code.size(); i++)
		ss << code[i];
	return ss.str();
}

size_t SolutionMap::size() const
{
	size_t n = 0;
	for (unsigned int r = 0; r < 10; r++)
		n += has(r);
	return n;
}

bool SolutionMap::offer(unsigned int key, const PartialSolution& solution)
{
	boost::optional<PartialSolution>& slot = slots_[key % 10];
	if (slot && slot->score < solution.score)
		return false;
	slot = solution;
	return true;
}

SolutionMap foldBody(const CandidateGrid& body)
{
	SolutionMap map;
	map.offer(0, PartialSolution());

	for (size_t p = 0; p < body.size(); p++) {
		const unsigned int weight = checksumWeight(p + 1);
		SolutionMap next;

		/* worst match first, so a better ranked candidate wins a tie */
		for (CandidateList::const_reverse_iterator c = body[p].rbegin(); c != body[p].rend(); ++c) {
			for (unsigned int r = 0; r < 10; r++) {
				if (!map.has(r))
					continue;
				PartialSolution s = map[r];
				s.digits.push_back(*c);
				s.score += c->value.score;
				next.offer(r + weight * c->value.digit, s);
			}
		}

		map = next;
	}

	return map;
}

SolutionMap keyByCheckDigit(const SolutionMap& residues)
{
	SolutionMap checks;

	for (unsigned int r = 0; r < 10; r++) {
		if (!residues.has(r))
			continue;

		const PartialSolution& s = residues[r];
		if (s.digits.size() < 6)
			continue;

		Parity pattern[6];
		for (size_t i = 0; i < 6; i++)
			pattern[i] = parityOf(s.digits[i]);

		unsigned int first;
		if (!firstDigitOf(pattern, first)) // not a valid left half
			continue;

		PartialSolution full;
		full.digits.push_back(ParityCandidate(None, CandidateDigit(0, first)));
		full.digits.insert(full.digits.end(), s.digits.begin(), s.digits.end());
		full.score = s.score;

		checks.offer((10 - (r + first) % 10) % 10, full);
	}

	return checks;
}

bool solve(const CandidateGrid& grid, Ean13& code)
{
	if (grid.size() != 12)
		return false;
	for (size_t i = 0; i < grid.size(); i++) {
		if (grid[i].empty())
			return false;
	}

	const CandidateGrid body(grid.begin(), grid.end() - 1);
	const SolutionMap checks = keyByCheckDigit(foldBody(body));

	const CandidateList& observed = grid.back();
	for (size_t i = 0; i < observed.size(); i++) {
		const unsigned int check = observed[i].value.digit;
		if (!checks.has(check))
			continue;

		const PartialSolution& s = checks[check];
		for (size_t j = 0; j < 12; j++)
			code[j] = s.digits[j].value.digit;
		code[12] = check;
		return true;
	}

	return false;
}
