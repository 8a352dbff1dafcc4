//
//  MilpBackend.hpp
//  mgmpc
//

#ifndef MilpBackend_hpp
#define MilpBackend_hpp

#include <ostream>
#include <string>
#include <vector>

#include "MilpProgram.hpp"

using namespace std;

enum SolveStatus {
	SOLVE_OPTIMAL,
	SOLVE_INFEASIBLE,
	SOLVE_UNBOUNDED,
	SOLVE_FAILED		// no definitive answer: license, time limit, numerical trouble, ...
};

struct SolveOptions {
	SolveOptions () : timeLimit(60.0), mipGap(1e-7), threads(1) {}

	double	timeLimit;		// seconds
	double	mipGap;			// relative
	int		threads;
};

struct BackendResult {
	BackendResult () : status(SOLVE_FAILED), objValue(0) {}

	SolveStatus		status;
	double			objValue;
	vector<double>	values;		// indexed like the program's variables, filled when optimal
	string			message;	// reason of a failure
};

/* A MILP solver library able to solve a MilpProgram */
class MilpBackend {

public:
	virtual ~MilpBackend () {}

	virtual string name () const = 0;
	virtual BackendResult solve (const MilpProgram &prog, const SolveOptions &opts, ostream &log) = 0;
};

#endif /* MilpBackend_hpp */
