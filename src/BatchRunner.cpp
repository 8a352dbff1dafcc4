//
//  BatchRunner.cpp
//  mgmpc
//

#include "BatchRunner.hpp"
#include "misc.hpp"

BatchRunner::BatchRunner(const ScenarioTable &table, const SystemParams &sys, const runType &run)
	: table(table), sys(sys), runParam(run) {}

BatchRunner::~BatchRunner() {}

/****************************************************************************
 * run
 * - Solves every case on a pool of batchThreads workers and returns the
 * outcomes in the order of _cases_.
 * - Per-step console lines are only printed when the cases run one at a
 * time.
 ****************************************************************************/
vector<CaseOutcome> BatchRunner::run(const vector<ScenarioCase> &cases) {
	vector<CaseOutcome> outcomes (cases.size());

	int numThreads = min(runParam.batchThreads, (int) cases.size());
	if ( numThreads < 1 ) numThreads = 1;
	bool verbose = runParam.verbose && numThreads == 1;

	/***** Parallel programming stuff (START) *****/
	boost::asio::io_service io_service;				// create an io_service
	boost::scoped_ptr<boost::asio::io_service::work> work (new boost::asio::io_service::work(io_service));	// keeps run() from exiting while cases are posted
	boost::thread_group threads;					// start some worker threads

	try {
		for (int k=0; k<numThreads; k++) {
			threads.create_thread(boost::bind(&boost::asio::io_service::run, &io_service));
		}
		/***** Parallel programming stuff (END)   *****/

		for (unsigned int c=0; c<cases.size(); c++) {
			io_service.post( boost::bind(&BatchRunner::solveOneCase, this,
										 boost::cref(cases[c]),
										 boost::ref(outcomes[c]),
										 verbose) );
		}
	}
	catch (...) {
		/* drop the pending cases and release the workers before unwinding */
		work.reset();
		io_service.stop();
		threads.join_all();
		throw;
	}

	/***** Parallel programming stuff (START) *****/
	work.reset();		// let the io_service shutdown once the queue is empty
	threads.join_all();
	/***** Parallel programming stuff (END)   *****/

	for (unsigned int c=0; c<outcomes.size(); c++) {
		const CaseOutcome &o = outcomes[c];
		printf("Case %-12s: %s (%d hours committed, %.2f s).\n",
			   o.scenario.name.empty() ? "(single)" : o.scenario.name.c_str(),
			   o.success ? "Success" : "Failed", o.schedule.size(), o.wallTime);
		if ( !o.success )
			cerr << "  " << o.errorMessage << endl;
		if ( o.toleranceWarnings > 0 )
			printf("  %d horizon(s) exceeded the energy balance tolerance.\n", o.toleranceWarnings);
	}

	return outcomes;
}//END run()

void BatchRunner::solveOneCase(const ScenarioCase &scenario, CaseOutcome &outcome, bool verbose) {
	runType caseParam = runParam;
	caseParam.verbose = verbose;

	outcome.scenario = scenario;
	try {
		ScenarioRun caseRun(table, sys, caseParam, scenario);

		if ( !runParam.logDir.empty() ) {
			string fname = runParam.logDir + "/solver" + (scenario.name.empty() ? "" : "_" + scenario.name) + ".log";
			if ( !caseRun.openLogFile(fname) )
				cerr << "Warning:: could not open the log file " << fname << ", the case runs without a log." << endl;
		}

		caseRun.execute(outcome);
		caseRun.closeLogFile();
	}
	catch (exception &e) {	// must not escape the worker thread
		outcome.success = false;
		outcome.errorMessage = e.what();
	}
}
