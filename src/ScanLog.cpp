#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <iostream>
#include <sqlite3.h>
#include "console.h"
#include "ScanLog.h"

ScanLog::ScanLog()
		: db(0)
{
}

ScanLog::~ScanLog()
{
	close();
}

bool ScanLog::open(const std::string& path)
{
	close();

	if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
		std::cerr << KRED << sqlite3_errmsg(db) << RESET << "\n";
		close();
		return false;
	}

	if (!exec("create table if not exists scans (id integer primary key autoincrement, code text not null, "
			"source text, scanned_at text default current_timestamp);")) {
		close();
		return false;
	}

	return true;
}

void ScanLog::close()
{
	if (db)
		sqlite3_close(db);
	db = 0;
}

bool ScanLog::exec(const char *sql)
{
	char *error = 0;

	if (sqlite3_exec(db, sql, 0, 0, &error) != SQLITE_OK) {
		std::cerr << KRED << (error ? error : sqlite3_errmsg(db)) << RESET << "\n";
		sqlite3_free(error);
		return false;
	}

	return true;
}

int ScanLog::count(const std::string& code)
{
	if (!db)
		return -1;

	sqlite3_stmt *stmt = 0;
	if (sqlite3_prepare_v2(db, "select count(*) from scans where code = ?;", -1, &stmt, 0) != SQLITE_OK) {
		std::cerr << KRED << sqlite3_errmsg(db) << RESET << "\n";
		return -1;
	}

	sqlite3_bind_text(stmt, 1, code.c_str(), -1, SQLITE_TRANSIENT);

	int n = -1;
	if (sqlite3_step(stmt) == SQLITE_ROW)
		n = sqlite3_column_int(stmt, 0);
	else
		std::cerr << KRED << sqlite3_errmsg(db) << RESET << "\n";

	sqlite3_finalize(stmt);
	return n;
}

bool ScanLog::record(const std::string& code, const std::string& source)
{
	if (!db)
		return false;

	sqlite3_stmt *stmt = 0;
	if (sqlite3_prepare_v2(db, "insert into scans (code, source) values (?, ?);", -1, &stmt, 0) != SQLITE_OK) {
		std::cerr << KRED << sqlite3_errmsg(db) << RESET << "\n";
		return false;
	}

	sqlite3_bind_text(stmt, 1, code.c_str(), -1, SQLITE_TRANSIENT);
	sqlite3_bind_text(stmt, 2, source.c_str(), -1, SQLITE_TRANSIENT);

	const bool done = sqlite3_step(stmt) == SQLITE_DONE;
	if (!done)
		std::cerr << KRED << sqlite3_errmsg(db) << RESET << "\n";

	sqlite3_finalize(stmt);
	return done;
}
