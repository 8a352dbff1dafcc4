//
//  main.cpp
//  mgmpc
//

#include "misc.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "solution.hpp"
#include "BatchRunner.hpp"
#include "HorizonSolver.hpp"
#include "scenario/ScenarioTable.hpp"

void parseCmdLine (int argc, const char *argv[], string &tablePath, string &runPath, string &outPrefix, string &mode);
int  runPlan (const ScenarioTable &table, const SystemParams &sys, const runType &run, const string &outPrefix);
int  runReceding (const ScenarioTable &table, const SystemParams &sys, const runType &run, const string &outPrefix);

int main(int argc, const char * argv[]) {
	string tablePath, runPath, outPrefix, mode;

	parseCmdLine(argc, argv, tablePath, runPath, outPrefix, mode);

	runType run;
	SystemParams sys;
	setDefaults(run);
	setDefaults(sys);

	/* Read the configuration file */
	if ( !readRunfile(runPath, run, sys) )
		return 1;

	if ( mode == "plan" )
		run.mode = PLAN;
	else if ( mode == "receding" )
		run.mode = RECEDING;
	else if ( !mode.empty() ) {
		cerr << "Unknown run mode " << mode << " (expected receding or plan)." << endl;
		return 1;
	}

	try {
		checkParams(run, sys);
		printSummary(run, sys);

		/* Read the hourly forecasts and prices */
		ScenarioTable table;
		readScenarioTable(tablePath, table);
		printf("%-23s%s%d hours (%d to %d)\n", "Scenario table", ": ", table.numHours(), table.firstHour, table.lastHour());

		if ( run.mode == PLAN )
			return runPlan(table, sys, run, outPrefix);
		else
			return runReceding(table, sys, run, outPrefix);
	}
	catch (DispatchError &e) {
		cerr << "Error: " << e.what() << endl;
		return 1;
	}
}

void parseCmdLine (int argc, const char *argv[], string &tablePath, string &runPath, string &outPrefix, string &mode) {
	if ( argc == 4 || argc == 5 ) {
		tablePath	= argv[1];
		runPath		= argv[2];
		outPrefix	= argv[3];
		mode		= (argc == 5) ? argv[4] : "";
	}
	else {
		cout << "Missing inputs. Please provide the following in the given order:\n  (1) scenario table (csv),\n  (2) run parameters file,\n  (3) output prefix,\n  (4) optionally, the run mode (receding or plan)." << endl;
		exit(1);
	}
}//END parseCmdLine()

/* Solves a single horizon at the start hour and writes its full plan */
int runPlan (const ScenarioTable &table, const SystemParams &sys, const runType &run, const string &outPrefix) {
	SolveOptions opts;
	opts.timeLimit = run.solveTimeLimit;
	opts.mipGap = run.mipGap;
	opts.threads = run.solverThreads;

	BackendChain chain(run.backends);
	MilpHorizonSolver solver(chain, opts, cout);

	ScenarioWindow window = table.window(run.startHour, run.horizon, sys);

	printf("Horizon solve (hour %d): ", run.startHour);
	fflush(stdout);
	double begin_t = get_wall_time();
	HorizonResult result = solver.solve(window, run.socInit);
	printf("Success (Obj= %.2f, %s, %.2f s).\n", result.objValue, result.backend.c_str(), get_wall_time() - begin_t);

	if ( !printHorizonPlan(outPrefix + ".csv", result) ) {
		perror("Failed to write the horizon plan.\n");
		return 1;
	}
	return 0;
}//END runPlan()

/* Runs the batch of receding-horizon cases and writes one schedule per case */
int runReceding (const ScenarioTable &table, const SystemParams &sys, const runType &run, const string &outPrefix) {
	vector<ScenarioCase> cases = buildCases(run, sys);

	cout << "------------------------------------------------------------------" << endl;
	cout << "------------ Receding-Horizon Dispatch (" << cases.size() << " case" << (cases.size() > 1 ? "s" : "") << ") ------------" << endl;

	BatchRunner batch(table, sys, run);
	vector<CaseOutcome> outcomes = batch.run(cases);

	int status = 0;
	for (unsigned int c=0; c<outcomes.size(); c++) {
		const CaseOutcome &o = outcomes[c];
		string fname = outPrefix + (o.scenario.name.empty() ? "" : "_" + o.scenario.name) + ".csv";

		if ( !o.schedule.empty() && !printSchedule(fname, o.schedule) ) {
			perror("Failed to write the committed schedule.\n");
			status = 1;
		}
		if ( !o.success )
			status = 1;
	}
	cout << "------------------------------------------------------------------" << endl;

	return status;
}//END runReceding()
