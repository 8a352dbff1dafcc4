//
//  config.hpp
//  mgmpc
//

#ifndef config_hpp
#define config_hpp

#include <string>
#include <vector>

using namespace std;

enum RunMode {
	RECEDING,		// receding-horizon simulation over the whole table
	PLAN			// a single horizon solve at the start hour
};

/* Physical and economic parameters of the microgrid */
struct SystemParams {
	double	timestep;			// hours per step

	double	importMax;			// MW
	double	exportMax;			// MW

	double	elyNominal;			// MW, electrolyzer
	double	elyMin;				// MW
	double	fcNominal;			// MW, fuel cell
	double	fcMin;				// MW
	double	dgNominal;			// MW, diesel generator
	double	dgMin;				// MW

	double	etaEly;				// electrolyzer efficiency (power to stored hydrogen)
	double	etaFc;				// fuel-cell efficiency (stored hydrogen to power)
	double	etaDg;				// diesel efficiency (fuel to power)

	double	storageCapacity;	// MWh of hydrogen-equivalent energy
	double	fuelPrice;			// currency / MWh of fuel
	double	curtailPenalty;		// currency / MWh curtailed

	bool	gridExclusive;		// true if import and export may not happen in the same hour
};

struct runType {
	int		horizon;			// H, hours per horizon solve
	int		startHour;			// first simulated hour
	double	socInit;			// MWh in storage before the start hour
	int		maxSteps;			// 0 if the controller should run until the data is exhausted

	RunMode	mode;

	vector<double>	fuelPrices;		// batch cases, currency / MWh (empty: SystemParams::fuelPrice)
	vector<double>	loadNominals;	// batch cases, MW peak load (empty: loads as given)

	vector<string>	backends;		// preference order of the MILP backends
	double	solveTimeLimit;		// seconds per horizon solve
	double	mipGap;				// relative MIP gap
	int		solverThreads;		// threads used by a single backend solve
	int		batchThreads;		// number of scenarios solved in parallel

	bool	verbose;			// per-step console output
	string	logDir;				// directory for per-case solver logs, empty if not logging ("none" in the run file)
};

void setDefaults (SystemParams &sys);
void setDefaults (runType &run);

bool readRunfile (string fname, runType &run, SystemParams &sys);
void checkParams (const SystemParams &sys);
void checkParams (const runType &run, const SystemParams &sys);
void printSummary (const runType &run, const SystemParams &sys);

const double EPSzero = 1e-8;
const double MilpInfinity = 1e20;

const double defaultCurtailPenalty = 1.0;	// currency / MWh
const double balanceTolCoef = 1e-6;			// energy balance tolerance, relative to the peak load

const char delimiter = ',';

#endif /* config_hpp */
