#ifndef EANSCAN_SCANLOG_H
#define EANSCAN_SCANLOG_H

#include <string>

struct sqlite3;

/* history of decoded codes kept in an sqlite database */
class ScanLog {
public:
	ScanLog();
	~ScanLog();

	bool open(const std::string& path); // creates the scans table if missing
	void close();
	bool isOpen() const { return db != 0; }

	int count(const std::string& code); // times code was recorded before, -1 on error
	bool record(const std::string& code, const std::string& source);

private:
	ScanLog(const ScanLog&);
	ScanLog& operator=(const ScanLog&);

	bool exec(const char *sql);

	sqlite3 *db;
};

#endif
