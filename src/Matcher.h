#ifndef EANSCAN_MATCHER_H
#define EANSCAN_MATCHER_H

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <vector>
#include "Signal.h"

#ifndef BARCODE_CANDIDATES
#define BARCODE_CANDIDATES 3
#endif

/* which table a left digit matched: L codes (odd) or G codes (even). right digits carry None */
enum Parity {
	Odd,
	Even,
	None
};

template <typename T>
struct ParityTagged {
	ParityTagged(Parity parity_, const T& value_) : parity(parity_), value(value_) {}

	Parity parity;
	T value;
};

template <typename T>
bool compareWithoutParity(const ParityTagged<T>& a, const ParityTagged<T>& b)
{
	return a.value < b.value;
}

template <typename T>
Parity parityOf(const ParityTagged<T>& tagged)
{
	return tagged.parity;
}

struct CandidateDigit {
	CandidateDigit(double score_, unsigned int digit_) : score(score_), digit(digit_) {}

	bool operator<(const CandidateDigit& other) const
	{
		return score < other.score || (score == other.score && digit < other.digit);
	}

	double score; // distance to the reference pattern, lower is better
	unsigned int digit;
};

typedef ParityTagged<CandidateDigit> ParityCandidate;
typedef std::vector<ParityCandidate> CandidateList; // best match first
typedef std::vector<CandidateList> CandidateGrid; // six left digits, five right digits, check digit

typedef std::vector<double> ScaledRun; // run lengths divided by their sum

class ReferenceTable {
public:
	static const ReferenceTable& leftOdd(); // L codes
	static const ReferenceTable& leftEven(); // G codes, the L widths reversed
	static const ReferenceTable& right(); // R codes, the L widths starting with a bar

	const ScaledRun& operator[](unsigned int digit) const { return digits_[digit]; }

	static const unsigned int widths[10][4]; // module widths of the L codes, space first

private:
	explicit ReferenceTable(bool reversed);

	ScaledRun digits_[10];
};

extern const Parity firstDigitParity[10][6]; // parity of the six left digits for each first digit
bool firstDigitOf(const Parity pattern[6], unsigned int& digit);

static const size_t groupRuns = 4; // bars and spaces per digit
static const size_t guardRuns = 3;
static const size_t centreRuns = 5;
static const size_t minimumRuns = 2 * guardRuns + 12 * groupRuns + centreRuns; // 59

ScaledRun scaleToOne(const size_t *runs, size_t count);
double distance(const ScaledRun& a, const ScaledRun& b); // sum of absolute differences
std::vector<CandidateDigit> matchGroup(const ReferenceTable& table, const size_t *runs,
        size_t keep = BARCODE_CANDIDATES);

CandidateList bestLeft(const size_t *runs); // odd and even matches merged by score
CandidateList bestRight(const size_t *runs);

/*
 * scores the twelve digit groups of a barcode whose start guard is the first
 * run in [first, last). fails without scoring if fewer than 59 runs are left
 * or the first run is light.
 */
bool candidateDigits(RunLength::const_iterator first, RunLength::const_iterator last, CandidateGrid& grid);

#endif
