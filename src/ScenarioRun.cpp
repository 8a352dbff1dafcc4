//
//  ScenarioRun.cpp
//  mgmpc
//

#include "ScenarioRun.hpp"
#include "HorizonSolver.hpp"
#include "RecedingController.hpp"
#include "errors.hpp"
#include "misc.hpp"

ScenarioRun::ScenarioRun(const ScenarioTable &table, const SystemParams &sys, const runType &run, const ScenarioCase &scenario)
	: table(table), sys(sys), runParam(run), scenario(scenario) {

	this->sys.fuelPrice = scenario.fuelPrice;
	if ( scenario.loadNominal > 0 )
		this->table.scaleLoadToNominal(scenario.loadNominal);
}

/****************************************************************************
 * execute
 * - Runs the controller over the case data with a backend chain of its own.
 * - A failure is recorded in _outcome_ together with the hours committed
 * before it, it is not propagated.
 ****************************************************************************/
void ScenarioRun::execute(CaseOutcome &outcome) {
	double begin_t = get_wall_time();

	outcome.scenario = scenario;
	outcome.success = false;

	out() << "------------------------------------------------------------------" << endl;
	out() << "Case " << (scenario.name.empty() ? "(single)" : scenario.name) << ": fuel price " << sys.fuelPrice
		  << ", peak load " << table.peakLoad() << " MW, started " << getCurrentDateTime() << endl;

	SolveOptions opts;
	opts.timeLimit = runParam.solveTimeLimit;
	opts.mipGap = runParam.mipGap;
	opts.threads = runParam.solverThreads;

	try {
		BackendChain chain(runParam.backends);
		MilpHorizonSolver solver(chain, opts, out());
		RecedingController controller(table, sys, runParam, solver, out());

		try {
			controller.run();
			outcome.success = true;
		}
		catch (exception &e) {
			outcome.errorMessage = e.what();
			out() << "Case failed: " << e.what() << endl;
		}

		outcome.schedule = controller.schedule();
		outcome.toleranceWarnings = solver.numToleranceWarnings();
	}
	catch (exception &e) {	// the backend list could not be set up
		outcome.errorMessage = e.what();
		out() << "Case failed: " << e.what() << endl;
	}

	outcome.wallTime = get_wall_time() - begin_t;
	out() << "Committed " << outcome.schedule.size() << " hours in " << outcome.wallTime << " s." << endl;
}//END execute()

/****************************************************************************
 * out
 * returns the log stream; output is discarded while no file is open
 ****************************************************************************/
ofstream& ScenarioRun::out() {
	return log_stream;
}

string ScenarioRun::getLogStreamName() {
	return log_stream_name;
}

/****************************************************************************
 * openLogFile
 * opens a log file with the input name. It receives the solver output,
 * backend fallbacks and tolerance warnings of this case.
 ****************************************************************************/
bool ScenarioRun::openLogFile(string filename) {
	bool status = open_file(log_stream, filename);
	if (status) {
		log_stream_name = filename;
	}

	return status;
}

void ScenarioRun::closeLogFile() {
	log_stream.close();
}

/* "cf045" for 450 per MWh (0.45 per kWh), "_L120" appended for a nominal load */
string caseName (double fuelPrice, double loadNominal, bool withFuel, bool withLoad) {
	char buf[64];
	string name;

	if ( withFuel ) {
		sprintf(buf, "%.2f", fuelPrice / 1000.0);
		string fuel = buf;
		fuel.erase(remove(fuel.begin(), fuel.end(), '.'), fuel.end());
		name = "cf" + fuel;
	}
	if ( withLoad ) {
		sprintf(buf, "L%g", loadNominal);
		name += (name.empty() ? "" : "_") + string(buf);
	}

	return name;
}

/****************************************************************************
 * buildCases
 * - All combinations of the listed fuel prices and nominal loads. An empty
 * list stands for the single system value (or the loads as given).
 * - Names are empty when the batch has a single case.
 ****************************************************************************/
vector<ScenarioCase> buildCases (const runType &run, const SystemParams &sys) {
	vector<double> fuels = run.fuelPrices;
	vector<double> loads = run.loadNominals;
	if ( fuels.empty() ) fuels.push_back(sys.fuelPrice);
	if ( loads.empty() ) loads.push_back(0.0);

	bool single = (fuels.size() == 1 && loads.size() == 1);

	vector<ScenarioCase> cases;
	for (unsigned int f=0; f<fuels.size(); f++) {
		for (unsigned int l=0; l<loads.size(); l++) {
			ScenarioCase c;
			c.fuelPrice = fuels[f];
			c.loadNominal = loads[l];
			if ( !single )
				c.name = caseName(fuels[f], loads[l], true, !run.loadNominals.empty());
			cases.push_back(c);
		}
	}

	return cases;
}//END buildCases()
