//
//  RecedingController.cpp
//  mgmpc
//

#include "RecedingController.hpp"
#include "errors.hpp"
#include "misc.hpp"

RecedingController::RecedingController(const ScenarioTable &table, const SystemParams &sys, const runType &run, HorizonSolver &solver, ostream &log)
	: table(table), sys(sys), runParam(run), solver(solver), log(log), state_(Initializing), hour(run.startHour), soc(run.socInit) {}

/****************************************************************************
 * initialize
 * - Validates the parameters and places the controller at the start hour
 * with the initial storage level. Any previous schedule is discarded.
 ****************************************************************************/
void RecedingController::initialize() {
	checkParams(runParam, sys);

	if ( !table.hasHour(runParam.startHour) )
		throw InputShapeError("start hour " + numToStr(runParam.startHour) + " is not in the table (hours "
							  + numToStr(table.firstHour) + " to " + numToStr(table.lastHour()) + ")");

	hour = runParam.startHour;
	soc = runParam.socInit;
	committed = CommittedSchedule();
	state_ = finished() ? Done : Stepping;
}//END initialize()

bool RecedingController::finished() const {
	if ( hour + runParam.horizon > table.lastHour() )
		return true;
	if ( runParam.maxSteps > 0 && committed.size() >= runParam.maxSteps )
		return true;
	return false;
}

/****************************************************************************
 * step
 * - Solves the window starting at the current hour and commits its first
 * hour. The storage level of the committed hour becomes the initial level
 * of the next window.
 * - On a solver error the controller moves to Failed, keeps the hours
 * committed so far and rethrows.
 ****************************************************************************/
bool RecedingController::step() {
	if ( state_ == Initializing )
		initialize();
	if ( state_ == Failed )
		throw logic_error("the controller has failed, resume it before stepping again");
	if ( state_ == Done )
		return false;

	if ( runParam.verbose ) {
		printf("Horizon solve (hour %d): ", hour);
		fflush(stdout);
	}

	HorizonResult result;
	try {
		ScenarioWindow window = table.window(hour, runParam.horizon, sys);
		result = solver.solve(window, soc);
		if ( result.dispatch.empty() )
			throw DispatchError("the horizon solver returned an empty plan for hour " + numToStr(hour));
	}
	catch (exception &e) {
		state_ = Failed;
		if ( runParam.verbose ) printf("Failed.\n");
		log << "Receding-horizon run stopped at hour " << hour << " after " << committed.size() << " committed hours: " << e.what() << endl;
		throw;
	}

	const DispatchDecision &first = result.dispatch[0];
	committed.commit(hour, first, result.objValue);
	soc = first.soc;
	hour++;

	if ( runParam.verbose ) printf("Success (Obj= %.2f).\n", result.objValue);

	if ( finished() ) {
		state_ = Done;
		return false;
	}
	return true;
}//END step()

void RecedingController::run() {
	if ( state_ == Initializing )
		initialize();

	while ( step() );
}

/****************************************************************************
 * resume
 * - Continues after the last hour of _prefix_, a schedule produced by an
 * earlier run over the same table. The storage level of its last hour
 * becomes the initial level.
 ****************************************************************************/
void RecedingController::resume(const CommittedSchedule &prefix) {
	checkParams(runParam, sys);

	if ( prefix.empty() ) {
		initialize();
		return;
	}

	if ( !table.hasHour(prefix.firstHour()) || !table.hasHour(prefix.lastHour()) )
		throw InputShapeError("schedule hours " + numToStr(prefix.firstHour()) + " to " + numToStr(prefix.lastHour()) + " are not in the table");

	committed = prefix;
	hour = prefix.lastHour() + 1;
	soc = prefix.lastSoc();
	state_ = finished() ? Done : Stepping;

	log << "Resuming the receding-horizon run at hour " << hour << " with " << soc << " MWh in storage." << endl;
}//END resume()
