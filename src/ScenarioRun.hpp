//
//  ScenarioRun.hpp
//  mgmpc
//

#ifndef ScenarioRun_hpp
#define ScenarioRun_hpp

#include <fstream>
#include <string>

#include "config.hpp"
#include "solution.hpp"
#include "scenario/ScenarioTable.hpp"

using namespace std;

/* One case of a batch: a fuel price and, optionally, a nominal peak load */
struct ScenarioCase {
	ScenarioCase () : fuelPrice(0), loadNominal(0) {}

	string	name;			// output suffix, empty for a single-case batch
	double	fuelPrice;		// currency / MWh
	double	loadNominal;	// MW, 0 if the loads are used as given
};

struct CaseOutcome {
	CaseOutcome () : success(false), wallTime(0), toleranceWarnings(0) {}

	ScenarioCase		scenario;
	CommittedSchedule	schedule;		// hours committed before the run ended or failed
	bool				success;
	string				errorMessage;
	double				wallTime;		// seconds
	int					toleranceWarnings;
};

/* A self-contained receding-horizon run over its own copy of the data */
class ScenarioRun {

public:
	ScenarioRun (const ScenarioTable &table, const SystemParams &sys, const runType &run, const ScenarioCase &scenario);

	void	execute (CaseOutcome &outcome);

	/* log keeping */
	ofstream&	out ();
	string		getLogStreamName ();
	bool		openLogFile (string filename);
	void		closeLogFile ();

private:
	ScenarioTable	table;
	SystemParams	sys;
	runType			runParam;
	ScenarioCase	scenario;

	/* log keeping */
	ofstream	log_stream;
	string		log_stream_name;
};

vector<ScenarioCase> buildCases (const runType &run, const SystemParams &sys);
string caseName (double fuelPrice, double loadNominal, bool withFuel, bool withLoad);

#endif /* ScenarioRun_hpp */
