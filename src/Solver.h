#ifndef EANSCAN_SOLVER_H
#define EANSCAN_SOLVER_H

#include <string>
#include <vector>
#include <boost/array.hpp>
#include <boost/optional.hpp>
#include "Matcher.h"

typedef boost::array<unsigned int, 13> Ean13;

unsigned int checksumWeight(size_t index); // 1 for even positions, 3 for odd ones
unsigned int checkDigit(const Ean13& code); // from the first twelve digits
bool verifyChecksum(const Ean13& code);
std::string toString(const Ean13& code);

/* digit assignment for a prefix of the body, keyed by its checksum residue */
struct PartialSolution {
	PartialSolution() : score(0) {}

	std::vector<ParityCandidate> digits; // leftmost first
	double score; // accumulated match distance
};

/*
 * at most one partial solution per residue 0..9. offer() keeps the solution
 * with the lower score; on equal scores the newcomer replaces the old one.
 */
class SolutionMap {
public:
	bool has(unsigned int key) const { return slots_[key % 10].is_initialized(); }
	const PartialSolution& operator[](unsigned int key) const { return *slots_[key % 10]; }
	size_t size() const;

	bool offer(unsigned int key, const PartialSolution& solution);

private:
	boost::optional<PartialSolution> slots_[10];
};

/*
 * folds the eleven body positions (second to twelfth digit) into residue
 * space. position p contributes checksumWeight(p + 1) * digit.
 */
SolutionMap foldBody(const CandidateGrid& body);

/*
 * adds the first digit implied by each solution's left parity pattern and
 * re-keys the map by the check digit that completes the checksum.
 */
SolutionMap keyByCheckDigit(const SolutionMap& residues);

/*
 * finds a checksum consistent code from the twelve candidate lists produced
 * by candidateDigits(). check digit candidates are tried best first.
 */
bool solve(const CandidateGrid& grid, Ean13& code);

#endif
