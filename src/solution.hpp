//
//  solution.hpp
//  mgmpc
//

#ifndef solution_hpp
#define solution_hpp

#include <stdio.h>
#include <string>
#include <vector>

using namespace std;

/* Dispatch of a single hour */
struct DispatchDecision {

	DispatchDecision () : pImport(0), pExport(0), pEly(0), pFc(0), pDg(0), pCurt(0), soc(0),
						  uDg(false), uEly(false), uFc(false), uImport(false), uExport(false) {}

	double	pImport;	// MW bought from the grid
	double	pExport;	// MW sold to the grid
	double	pEly;		// MW consumed by the electrolyzer
	double	pFc;		// MW produced by the fuel cell
	double	pDg;		// MW produced by the diesel generator
	double	pCurt;		// MW of renewable production left unused
	double	soc;		// MWh in storage at the end of the hour

	bool	uDg, uEly, uFc;			// unit on/off states
	bool	uImport, uExport;		// grid direction states (meaningful with mutual exclusion only)
};

struct HorizonResult {

	HorizonResult () : beginHour(0), objValue(0), maxBalanceResidual(0) {}

	int		beginHour;
	vector<DispatchDecision> dispatch;		// one entry per hour of the window
	double	objValue;						// total window cost
	string	backend;						// name of the backend that produced the solution
	double	maxBalanceResidual;				// MW, worst energy balance mismatch after the solve
};

/* A committed hour of the receding-horizon run */
struct CommittedHour {
	int		hour;
	DispatchDecision decision;
	double	objValue;		// objective of the horizon the decision was taken from
};

/* Append-only record of the decisions applied by the controller */
class CommittedSchedule {

public:
	CommittedSchedule () {}

	void	commit (int hour, const DispatchDecision &decision, double objValue);

	int		size () const		{ return (int) rows.size(); }
	bool	empty () const		{ return rows.empty(); }
	int		firstHour () const;
	int		lastHour () const;
	double	lastSoc () const;

	const CommittedHour& operator[] (int k) const	{ return rows[k]; }
	const vector<CommittedHour>& hours () const		{ return rows; }

private:
	vector<CommittedHour> rows;
};

bool printSchedule (string filepath, const CommittedSchedule &schedule);
bool printHorizonPlan (string filepath, const HorizonResult &result);

#endif /* solution_hpp */
