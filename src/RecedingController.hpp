//
//  RecedingController.hpp
//  mgmpc
//

#ifndef RecedingController_hpp
#define RecedingController_hpp

#include <ostream>

#include "config.hpp"
#include "solution.hpp"
#include "HorizonSolver.hpp"
#include "scenario/ScenarioTable.hpp"

using namespace std;

enum ControllerState {
	Initializing,
	Stepping,
	Done,
	Failed
};

/****************************************************************************
 * RecedingController
 * - Solves an H-hour window at every simulated hour, commits only the
 * first hour of the plan and carries the committed storage level into the
 * next window.
 * - The run stops once a full window no longer fits the table, or after
 * maxSteps commits when the cap is set.
 ****************************************************************************/
class RecedingController {

public:
	RecedingController (const ScenarioTable &table, const SystemParams &sys, const runType &run, HorizonSolver &solver, ostream &log);

	void	initialize ();
	bool	step ();		// false once the controller has reached Done
	void	run ();
	void	resume (const CommittedSchedule &prefix);

	ControllerState	state () const		{ return state_; }
	int		currentHour () const		{ return hour; }
	double	currentSoc () const			{ return soc; }
	const CommittedSchedule& schedule () const	{ return committed; }

private:
	const ScenarioTable	&table;
	SystemParams		sys;
	runType				runParam;
	HorizonSolver		&solver;
	ostream				&log;

	ControllerState		state_;
	int					hour;		// first hour of the next window
	double				soc;		// MWh before _hour_
	CommittedSchedule	committed;

	bool	finished () const;
};

#endif /* RecedingController_hpp */
