//
//  HorizonModel.hpp
//  mgmpc
//

#ifndef HorizonModel_hpp
#define HorizonModel_hpp

#include <string>
#include <vector>

#include "config.hpp"
#include "solution.hpp"
#include "scenario/ScenarioWindow.hpp"
#include "solverUtilities/MilpBackend.hpp"
#include "solverUtilities/MilpProgram.hpp"

using namespace std;

#ifndef NAMESIZE
#define NAMESIZE 64
#endif

/* Mixed-integer dispatch model of one horizon */
class HorizonModel {

public:
	HorizonModel (const ScenarioWindow &window, double socInit);
	~HorizonModel ();

	void	formulate ();
	const MilpProgram& program () const	{ return prog; }

	HorizonResult extract (const BackendResult &sol, const string &backend) const;

	double	balanceResidual (const DispatchDecision &d, int t) const;

private:
	ScenarioWindow	window;
	double			socInit;		// MWh before the first hour of the window
	int				numPeriods;

	MilpProgram		prog;

	/* variable indices in prog, per period */
	vector<int> pImport, pExport, pEly, pFc, pDg, pCurt, soc;
	vector<int> uDg, uEly, uFc, uImport, uExport;	// uImport/uExport stay empty without mutual exclusion

	void	addUnitBounds (const char *unit, vector<int> &p, vector<int> &u, double nominal, double minimum);
};

#endif /* HorizonModel_hpp */
