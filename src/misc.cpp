#include "misc.hpp"

#include <time.h>
#include <sys/time.h>

/****************************************************************************
 * safeGetline
 * - Works the same as getline, however, can handle issues where the end of
 * line tokens might be either '\n', '\r', or '\n\r'.
 *****************************************************************************/
istream& safeGetline(istream& is, string& t)
{
	t.clear();

	// The sentry object performs stream bookkeeping before the buffer is
	// read character by character.
	std::istream::sentry se(is, true);
	std::streambuf* sb = is.rdbuf();

	for(;;) {
		int c = sb->sbumpc();
		switch (c) {
		case '\n':
			return is;
		case '\r':
			if(sb->sgetc() == '\n')
				sb->sbumpc();
			return is;
		case std::streambuf::traits_type::eof():
			// Also handle the case when the last line has no line ending
			if(t.empty())
				is.setstate(std::ios::eofbit);
			return is;
		default:
			t += (char)c;
		}
	}
}

/* The subroutine splits the line of type string along the delimiters into a vector of shorter strings */
vector<string> splitString(const string &line, char delimiter) {

	stringstream ss(line);
	string item;
	vector<string> tokens;
	while (getline(ss, item, delimiter)) {
		tokens.push_back(item);
	}
	return tokens;
}//END splitString()

/* Removes surrounding blanks and quotes */
string trimString(const string &str) {
	size_t first = str.find_first_not_of(" \t\"");
	if (first == string::npos)
		return "";
	size_t last = str.find_last_not_of(" \t\"");
	return str.substr(first, last-first+1);
}//END trimString()

/* Opens _filename_ for reading or writing, and reports on cerr if it cannot */
template <class fileStream>
static bool openStream (fileStream &fptr, const string &filename) {
	fptr.open( filename.c_str() );
	if ( fptr.fail() ) {
		cerr << "Error opening file: " << filename << endl;
		return false;
	}
	return true;
}

bool open_file (ifstream &fptr, string filename) {
	return openStream(fptr, filename);
}

bool open_file (ofstream &fptr, string filename) {
	return openStream(fptr, filename);
}

// Get current date/time, format is YYYY-MM-DD.HH:mm:ss
const std::string getCurrentDateTime() {
	time_t     now = time(0);
	struct tm  tstruct;
	char       buf[80];
	localtime_r(&now, &tstruct);
	strftime(buf, sizeof(buf), "%Y-%m-%d %X", &tstruct);

	return buf;
}

double get_wall_time(){
	struct timeval time;
	if ( gettimeofday(&time, NULL) )
		return 0;
	return (double)time.tv_sec + (double)time.tv_usec * .000001;
}
