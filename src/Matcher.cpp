#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <math.h>
#include <algorithm>
#include "Matcher.h"

const unsigned int ReferenceTable::widths[10][4] = {
	{ 3, 2, 1, 1 }, { 2, 2, 2, 1 }, { 2, 1, 2, 2 }, { 1, 4, 1, 1 }, { 1, 1, 3, 2 },
	{ 1, 2, 3, 1 }, { 1, 1, 1, 4 }, { 1, 3, 1, 2 }, { 1, 2, 1, 3 }, { 3, 1, 1, 2 } };

const Parity firstDigitParity[10][6] = {
	{ Odd, Odd, Odd, Odd, Odd, Odd },
	{ Odd, Odd, Even, Odd, Even, Even },
	{ Odd, Odd, Even, Even, Odd, Even },
	{ Odd, Odd, Even, Even, Even, Odd },
	{ Odd, Even, Odd, Odd, Even, Even },
	{ Odd, Even, Even, Odd, Odd, Even },
	{ Odd, Even, Even, Even, Odd, Odd },
	{ Odd, Even, Odd, Even, Odd, Even },
	{ Odd, Even, Odd, Even, Even, Odd },
	{ Odd, Even, Even, Odd, Even, Odd } };

ReferenceTable::ReferenceTable(bool reversed)
{
	for (unsigned int d = 0; d < 10; d++) {
		size_t runs[groupRuns];
		for (size_t i = 0; i < groupRuns; i++)
			runs[i] = widths[d][reversed ? groupRuns - 1 - i : i];
		digits_[d] = scaleToOne(runs, groupRuns);
	}
}

const ReferenceTable& ReferenceTable::leftOdd()
{
	static const ReferenceTable table(false);
	return table;
}

const ReferenceTable& ReferenceTable::leftEven()
{
	static const ReferenceTable table(true);
	return table;
}

const ReferenceTable& ReferenceTable::right()
{
	static const ReferenceTable table(false);
	return table;
}

bool firstDigitOf(const Parity pattern[6], unsigned int& digit)
{
	for (unsigned int d = 0; d < 10; d++) {
		if (std::equal(pattern, pattern + 6, firstDigitParity[d])) {
			digit = d;
			return true;
		}
	}
	return false;
}

ScaledRun scaleToOne(const size_t *runs, size_t count)
{
	size_t sum = 0;
	for (size_t i = 0; i < count; i++)
		sum += runs[i];

	ScaledRun scaled(count, 0.0);
	if (!sum)
		return scaled;
	for (size_t i = 0; i < count; i++)
		scaled[i] = (double) runs[i] / sum;
	return scaled;
}

double distance(const ScaledRun& a, const ScaledRun& b)
{
	double d = 0;
	for (size_t i = 0; i < a.size() && i < b.size(); i++)
		d += fabs(a[i] - b[i]);
	return d;
}

std::vector<CandidateDigit> matchGroup(const ReferenceTable& table, const size_t *runs, size_t keep)
{
	const ScaledRun observed = scaleToOne(runs, groupRuns);

	std::vector<CandidateDigit> scores;
	for (unsigned int d = 0; d < 10; d++)
		scores.push_back(CandidateDigit(distance(table[d], observed), d));

	std::sort(scores.begin(), scores.end());
	if (scores.size() > keep)
		scores.resize(keep, CandidateDigit(0, 0));
	return scores;
}

CandidateList bestLeft(const size_t *runs)
{
	const std::vector<CandidateDigit> odd = matchGroup(ReferenceTable::leftOdd(), runs);
	const std::vector<CandidateDigit> even = matchGroup(ReferenceTable::leftEven(), runs);

	CandidateList list;
	for (size_t i = 0; i < odd.size(); i++)
		list.push_back(ParityCandidate(Odd, odd[i]));
	for (size_t i = 0; i < even.size(); i++)
		list.push_back(ParityCandidate(Even, even[i]));

	std::stable_sort(list.begin(), list.end(), compareWithoutParity<CandidateDigit>);
	return list;
}

CandidateList bestRight(const size_t *runs)
{
	const std::vector<CandidateDigit> scores = matchGroup(ReferenceTable::right(), runs);

	CandidateList list;
	for (size_t i = 0; i < scores.size(); i++)
		list.push_back(ParityCandidate(None, scores[i]));
	return list;
}

bool candidateDigits(RunLength::const_iterator first, RunLength::const_iterator last, CandidateGrid& grid)
{
	grid.clear();

	/* a barcode starts on the dark bar of its guard pattern */
	if (last - first < (ptrdiff_t) minimumRuns || first->bit == One)
		return false;

	size_t lengths[minimumRuns];
	for (size_t i = 0; i < minimumRuns; i++)
		lengths[i] = first[i].length;

	const size_t *left = lengths + guardRuns;
	const size_t *right = left + 6 * groupRuns + centreRuns;

	for (size_t g = 0; g < 6; g++)
		grid.push_back(bestLeft(left + g * groupRuns));
	for (size_t g = 0; g < 6; g++)
		grid.push_back(bestRight(right + g * groupRuns));

	for (size_t i = 0; i < grid.size(); i++) {
		if (grid[i].empty()) {
			grid.clear();
			return false;
		}
	}

	return true;
}
