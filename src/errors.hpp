//
//  errors.hpp
//  mgmpc
//

#ifndef errors_hpp
#define errors_hpp

#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

class DispatchError : public runtime_error {
public:
	explicit DispatchError (const string &msg) : runtime_error(msg) {}
};

/* Inconsistent input arrays, or a window that does not fit the data */
class InputShapeError : public DispatchError {
public:
	explicit InputShapeError (const string &msg) : DispatchError("input shape: " + msg) {}
};

/* Parameters that cannot describe a physical system */
class ConfigError : public DispatchError {
public:
	explicit ConfigError (const string &msg) : DispatchError("configuration: " + msg) {}
};

class InfeasibleError : public DispatchError {
public:
	InfeasibleError (int beginHour, const string &backend)
		: DispatchError("horizon starting at hour " + to_string(beginHour) + " is infeasible (" + backend + ")"),
		  beginHour(beginHour) {}

	int beginHour;
};

class UnboundedError : public DispatchError {
public:
	UnboundedError (int beginHour, const string &backend)
		: DispatchError("horizon starting at hour " + to_string(beginHour) + " is unbounded (" + backend + ")"),
		  beginHour(beginHour) {}

	int beginHour;
};

/* Every backend in the preference list failed */
class SolverUnavailableError : public DispatchError {
public:
	explicit SolverUnavailableError (const vector<string> &failures)
		: DispatchError(compose(failures)), failures(failures) {}

	vector<string> failures;	// one message per backend, in the order tried

private:
	static string compose (const vector<string> &failures) {
		string msg = "no MILP backend could solve the horizon";
		for (unsigned int i=0; i<failures.size(); i++)
			msg += (i == 0 ? ": " : "; ") + failures[i];
		return msg;
	}
};

#endif /* errors_hpp */
