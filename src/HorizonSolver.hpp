//
//  HorizonSolver.hpp
//  mgmpc
//

#ifndef HorizonSolver_hpp
#define HorizonSolver_hpp

#include <ostream>

#include "solution.hpp"
#include "scenario/ScenarioWindow.hpp"
#include "solverUtilities/BackendChain.hpp"

using namespace std;

/* Computes the optimal dispatch of one window given the storage level before it */
class HorizonSolver {

public:
	virtual ~HorizonSolver () {}

	virtual HorizonResult solve (const ScenarioWindow &window, double socInit) = 0;
};

/* Formulates the window as a MILP and hands it to a backend chain */
class MilpHorizonSolver : public HorizonSolver {

public:
	MilpHorizonSolver (BackendChain &chain, const SolveOptions &opts, ostream &log);

	HorizonResult solve (const ScenarioWindow &window, double socInit);

	int		numToleranceWarnings () const	{ return toleranceWarnings; }

private:
	BackendChain	&chain;
	SolveOptions	opts;
	ostream			&log;

	int		toleranceWarnings;
};

#endif /* HorizonSolver_hpp */
