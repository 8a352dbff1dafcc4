//
//  BatchRunner.hpp
//  mgmpc
//

#ifndef BatchRunner_hpp
#define BatchRunner_hpp

#include <iostream>
#include <vector>

#include "config.hpp"
#include "ScenarioRun.hpp"
#include "scenario/ScenarioTable.hpp"

#include <boost/thread/thread.hpp>
#include <boost/bind.hpp>
#include <boost/asio.hpp>
#include <boost/scoped_ptr.hpp>

using namespace std;

/* Runs independent cases in parallel. Every case owns its data, backends and log. */
class BatchRunner {

public:
	BatchRunner (const ScenarioTable &table, const SystemParams &sys, const runType &run);
	~BatchRunner ();

	vector<CaseOutcome> run (const vector<ScenarioCase> &cases);

private:
	const ScenarioTable	&table;
	SystemParams		sys;
	runType				runParam;

	void	solveOneCase (const ScenarioCase &scenario, CaseOutcome &outcome, bool verbose);
};

#endif /* BatchRunner_hpp */
