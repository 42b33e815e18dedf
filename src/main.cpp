#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <getopt.h>
#include <algorithm>
#include <iostream>
#include <iterator>
#include <boost/algorithm/string.hpp>
#include <boost/bind/bind.hpp>
#include <boost/chrono.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/thread.hpp>
#include "console.h"
#include "Barcode.h"
#include "Generator.h"
#include "ScanLog.h"

#ifndef PACKAGE_NAME
#define PACKAGE_NAME "eanscan"
#endif
#ifndef PACKAGE_VERSION
#define PACKAGE_VERSION ""
#endif

namespace fs = boost::filesystem;

static const char short_options[] = "hr:t:j:d:Dvg:o:m:n:x:s:H:";

static const struct option long_options[] = {
	{ "help", no_argument, NULL, 'h' },
	{ "row", required_argument, NULL, 'r' },
	{ "threshold", required_argument, NULL, 't' },
	{ "jobs", required_argument, NULL, 'j' },
	{ "database", required_argument, NULL, 'd' },
	{ "duration", no_argument, NULL, 'D' },
	{ "verbose", no_argument, NULL, 'v' },
	{ "generate", required_argument, NULL, 'g' },
	{ "output", required_argument, NULL, 'o' },
	{ "module", required_argument, NULL, 'm' },
	{ "noise", required_argument, NULL, 'n' },
	{ "jitter", required_argument, NULL, 'x' },
	{ "seed", required_argument, NULL, 's' },
	{ "height", required_argument, NULL, 'H' },
	{ 0, 0, 0, 0 } };

static void printUsage(const char *executablePath)
{
	std::cout << PACKAGE_NAME " " PACKAGE_VERSION "\n"
	        << "usage:\n"
	        << executablePath << " [options] {image.ppm|directory}...\n"
	        << "  -r, --row N          scan row N instead of the vertical centre\n"
	        << "  -t, --threshold X    pivot ratio between darkest and brightest pixel [" << BARCODE_THRESHOLD << "]\n"
	        << "  -j, --jobs N         decode N files in parallel\n"
	        << "  -d, --database PATH  record decoded codes in an sqlite database\n"
	        << "  -D, --duration       report decoding time per file\n"
	        << "  -v, --verbose        trace digit candidates\n"
	        << executablePath << " -g DIGITS -o image.ppm [render options]\n"
	        << "  -g, --generate DIGITS  twelve digits, the check digit is appended\n"
	        << "  -o, --output PATH      image to write\n"
	        << "  -m, --module N         module width [px]\n"
	        << "  -H, --height N         image height [px]\n"
	        << "  -n, --noise F          luminance jitter as a fraction of full scale\n"
	        << "  -x, --jitter N         bar edge jitter [px]\n"
	        << "  -s, --seed N           noise seed\n";
}

struct ScanJob {
	ScanJob() : readable(false), duration(0) {}

	std::string path;
	bool readable;
	DecodeResult result;
	double duration; // [s]
};

static bool readFile(const std::string& path, std::vector<unsigned char>& data)
{
	fs::ifstream in(fs::path(path), std::ios::in | std::ios::binary);
	if (!in)
		return false;
	data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
	return !in.bad();
}

static bool writeFile(const std::string& path, const std::vector<unsigned char>& data)
{
	fs::ofstream out(fs::path(path), std::ios::out | std::ios::binary);
	if (!out)
		return false;
	out.write((const char *) &data[0], data.size());
	return out.good();
}

// each worker takes every step-th job starting at first
static void scanFiles(std::vector<ScanJob>& jobs, size_t first, size_t step, const DecodeOptions& options)
{
	for (size_t i = first; i < jobs.size(); i += step) {
		ScanJob& job = jobs[i];
		std::vector<unsigned char> raw;

		boost::chrono::time_point<boost::chrono::system_clock> start = boost::chrono::system_clock::now();

		job.readable = readFile(job.path, raw);
		if (job.readable)
			job.result = decodeBarcode(raw, options);

		boost::chrono::time_point<boost::chrono::system_clock> end = boost::chrono::system_clock::now();
		job.duration = (end - start).count() * (double) boost::chrono::system_clock::period::num
		        / boost::chrono::system_clock::period::den;
	}
}

static bool isImage(const fs::path& path)
{
	const std::string ext = path.extension().string();
	return boost::algorithm::iequals(ext, ".ppm") || boost::algorithm::iequals(ext, ".pnm");
}

static void collectImages(const std::string& arg, std::vector<std::string>& paths)
{
	boost::system::error_code ec;

	if (!fs::is_directory(arg, ec)) {
		paths.push_back(arg);
		return;
	}

	std::vector<std::string> found;
	for (fs::directory_iterator it(arg, ec), end; !ec && it != end; it.increment(ec)) {
		if (fs::is_regular_file(it->status()) && isImage(it->path()))
			found.push_back(it->path().string());
	}
	if (ec)
		std::cerr << KRED << arg << ": " << ec.message() << RESET << "\n";

	std::sort(found.begin(), found.end());
	paths.insert(paths.end(), found.begin(), found.end());
}

static int generate(const std::string& digits, const std::string& output, const RenderOptions& render)
{
	Ean13 code;

	if (!completeCode(digits, code)) {
		std::cerr << KRED << "expected twelve decimal digits, got \"" << digits << "\"" << RESET << "\n";
		return 1;
	}

	if (output.empty()) {
		std::cerr << KRED << "no output file given" << RESET << "\n";
		return 1;
	}

	Pixmap pixmap;
	if (!renderBarcode(code, render, pixmap)) {
		std::cerr << KRED << "bad render parameters: module width must exceed twice the jitter, noise lie in [0, 1]"
		        << RESET << "\n";
		return 1;
	}

	if (!writeFile(output, encodePixmap(pixmap))) {
		std::cerr << KRED << "cannot write " << output << RESET << "\n";
		return 1;
	}

	std::cout << KGRN << boost::format("%1% written to %2% (%3%x%4%)") % toString(code) % output % pixmap.width()
	        % pixmap.height() << RESET << "\n";
	return 0;
}

int main(int argc, char **argv)
{
	DecodeOptions options;
	RenderOptions render;
	size_t jobs = 1;
	bool duration = false;
	std::string database, digits, output;

	try {
		for (;;) {
			int index;
			const int c = getopt_long(argc, argv, short_options, long_options, &index);

			if (-1 == c)
				break;

			switch (c)
			{
			case 'h':
				printUsage(argv[0]);
				return 0;
			case 'r':
				options.row = boost::lexical_cast<long>(optarg);
				break;
			case 't':
				options.threshold = boost::lexical_cast<double>(optarg);
				break;
			case 'j':
				jobs = boost::lexical_cast<size_t>(optarg);
				break;
			case 'd':
				database = optarg;
				break;
			case 'D':
				duration = true;
				break;
			case 'v':
				options.verbose = true;
				break;
			case 'g':
				digits = optarg;
				break;
			case 'o':
				output = optarg;
				break;
			case 'm':
				render.moduleWidth = boost::lexical_cast<size_t>(optarg);
				break;
			case 'n':
				render.noise = boost::lexical_cast<double>(optarg);
				break;
			case 'x':
				render.jitter = boost::lexical_cast<unsigned int>(optarg);
				break;
			case 's':
				render.seed = boost::lexical_cast<unsigned long>(optarg);
				break;
			case 'H':
				render.height = boost::lexical_cast<size_t>(optarg);
				break;
			default:
				printUsage(argv[0]);
				return 1;
			}
		}
	} catch (const boost::bad_lexical_cast&) {
		std::cerr << KRED << "invalid numeric argument \"" << optarg << "\"" << RESET << "\n";
		return 1;
	}

	if (!digits.empty())
		return generate(digits, output, render);

	if (optind >= argc) {
		printUsage(argv[0]);
		return 1;
	}

	if (options.threshold <= 0 || options.threshold >= 1) {
		std::cerr << KRED << "threshold must lie strictly between 0 and 1" << RESET << "\n";
		return 1;
	}

	std::vector<std::string> paths;
	for (int i = optind; i < argc; i++)
		collectImages(argv[i], paths);

	std::vector<ScanJob> work(paths.size());
	for (size_t i = 0; i < paths.size(); i++)
		work[i].path = paths[i];

	if (jobs < 1)
		jobs = 1;
	if (jobs > work.size())
		jobs = work.size();

	if (jobs <= 1) {
		scanFiles(work, 0, 1, options);
	} else {
		boost::thread_group workers;
		for (size_t t = 0; t < jobs; t++)
			workers.create_thread(boost::bind(&scanFiles, boost::ref(work), t, jobs, boost::cref(options)));
		workers.join_all();
	}

	ScanLog log;
	if (!database.empty() && !log.open(database))
		std::cerr << KYEL << "continuing without scan log " << database << RESET << "\n";

	int failures = 0;
	for (size_t i = 0; i < work.size(); i++) {
		const ScanJob& job = work[i];

		if (!job.readable) {
			std::cerr << KRED << job.path << ": error: cannot read file" << RESET << "\n";
			failures++;
			continue;
		}

		if (!job.result.ok()) {
			std::cerr << KRED << job.path << ": error: " << job.result.message << RESET << "\n";
			failures++;
		} else {
			const std::string code = toString(job.result.digits);
			std::cout << job.path << ": " << KGRN << code << RESET << "\n";

			if (log.isOpen()) {
				const int seen = log.count(code);
				if (seen > 0)
					std::cout << KYEL << "  already scanned " << seen << (seen == 1 ? " time" : " times") << RESET
					        << "\n";
				if (!log.record(code, job.path))
					std::cerr << KYEL << "  scan of " << code << " not recorded" << RESET << "\n";
			}
		}

		if (duration)
			std::cout << KCYN << "  decode " << (int) (job.duration * 1e6) << " us" << RESET << "\n";
	}

	return failures ? 1 : 0;
}
