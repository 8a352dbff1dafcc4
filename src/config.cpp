//
//  config.cpp
//  mgmpc
//

#include <thread>

#include "config.hpp"
#include "errors.hpp"
#include "misc.hpp"

void setDefaults (SystemParams &sys) {
	sys.timestep = 1.0;
	sys.importMax = 1000.0;		sys.exportMax = 1000.0;
	sys.elyNominal = 0.0;		sys.elyMin = 0.0;
	sys.fcNominal = 0.0;		sys.fcMin = 0.0;
	sys.dgNominal = 0.0;		sys.dgMin = 0.0;
	sys.etaEly = 0.7;			sys.etaFc = 0.5;		sys.etaDg = 0.6;
	sys.storageCapacity = 0.0;
	sys.fuelPrice = 0.0;
	sys.curtailPenalty = defaultCurtailPenalty;
	sys.gridExclusive = true;
}

void setDefaults (runType &run) {
	run.horizon = 24;
	run.startHour = 0;
	run.socInit = 0.0;
	run.maxSteps = 0;
	run.mode = RECEDING;

	run.fuelPrices.clear();
	run.loadNominals.clear();

	run.backends = {"cplex", "gurobi"};
	run.solveTimeLimit = 60.0;
	run.mipGap = 1e-7;
	run.solverThreads = 1;
	run.batchThreads = max(1u, std::thread::hardware_concurrency());

	run.verbose = true;
	run.logDir = ".";
}

/* Parses a comma-separated list of numbers, scaled by _multiplier_ */
static vector<double> readNumberList (const string &field, double multiplier) {
	vector<double> vals;
	vector<string> tokens = splitString(field, delimiter);
	for (unsigned int i=0; i<tokens.size(); i++) {
		string tok = trimString(tokens[i]);
		if (!tok.empty())
			vals.push_back(atof(tok.c_str()) * multiplier);
	}
	return vals;
}

/****************************************************************************
 * readRunfile
 * - Reads "key value [unit]" lines into the run and system parameters.
 * Values not mentioned in the file keep their current setting.
 * - Returns false if the file cannot be opened.
 ****************************************************************************/
bool readRunfile (string fname, runType &run, SystemParams &sys) {
	ifstream fptr;
	string	 line, field1, field2, field3;
	double	 temp;

	if ( !open_file(fptr, fname) ) {
		perror("Failed to read the run parameters, using the default parameters.\n");
		return false;
	}

	while ( safeGetline(fptr, line) ) {
		istringstream iss(line);
		field3.clear();
		if ( !(iss >> field1 >> field2) )
			continue;
		if ( field1[0] == '#' )
			continue;
		iss >> field3;

		/* Convert time to hours, and fuel prices to currency per MWh */
		double multiplier = 1.0;
		if ( field3 == "minutes" )
			multiplier = 1.0/60.0;
		else if ( field3 == "per_kWh" )
			multiplier = 1000.0;
		temp = atof(field2.c_str()) * multiplier;

		if ( field1 == "horizon" )
			run.horizon = (int) round(temp);
		else if ( field1 == "start_hour" )
			run.startHour = (int) round(temp);
		else if ( field1 == "soc_init" )
			run.socInit = temp;
		else if ( field1 == "max_steps" )
			run.maxSteps = (int) round(temp);
		else if ( field1 == "timestep" )
			sys.timestep = temp;
		else if ( field1 == "import_max" )
			sys.importMax = temp;
		else if ( field1 == "export_max" )
			sys.exportMax = temp;
		else if ( field1 == "ely_nom" )
			sys.elyNominal = temp;
		else if ( field1 == "ely_min" )
			sys.elyMin = temp;
		else if ( field1 == "fc_nom" )
			sys.fcNominal = temp;
		else if ( field1 == "fc_min" )
			sys.fcMin = temp;
		else if ( field1 == "dg_nom" )
			sys.dgNominal = temp;
		else if ( field1 == "dg_min" )
			sys.dgMin = temp;
		else if ( field1 == "eta_ely" )
			sys.etaEly = temp;
		else if ( field1 == "eta_fc" )
			sys.etaFc = temp;
		else if ( field1 == "eta_dg" )
			sys.etaDg = temp;
		else if ( field1 == "h2_storage" )
			sys.storageCapacity = temp;
		else if ( field1 == "fuel_price" )
			sys.fuelPrice = temp;
		else if ( field1 == "curtail_penalty" )
			sys.curtailPenalty = temp;
		else if ( field1 == "grid_exclusive" )
			sys.gridExclusive = (temp > 0.5);
		else if ( field1 == "fuel_prices" )
			run.fuelPrices = readNumberList(field2, multiplier);
		else if ( field1 == "load_nominals" )
			run.loadNominals = readNumberList(field2, 1.0);
		else if ( field1 == "backends" ) {
			run.backends.clear();
			vector<string> tokens = splitString(field2, delimiter);
			for (unsigned int i=0; i<tokens.size(); i++)
				if (!trimString(tokens[i]).empty())
					run.backends.push_back(trimString(tokens[i]));
		}
		else if ( field1 == "solve_time_limit" )
			run.solveTimeLimit = temp;
		else if ( field1 == "mip_gap" )
			run.mipGap = temp;
		else if ( field1 == "solver_threads" )
			run.solverThreads = (int) round(temp);
		else if ( field1 == "batch_threads" )
			run.batchThreads = (int) round(temp);
		else if ( field1 == "verbose" )
			run.verbose = (temp > 0.5);
		else if ( field1 == "log_dir" )
			run.logDir = (field2 == "none") ? "" : field2;
		else if ( field1 == "mode" ) {
			if ( field2 == "plan" )			run.mode = PLAN;
			else if ( field2 == "receding" )	run.mode = RECEDING;
			else	perror("Warning:: Unidentified run mode in the file.\n");
		}
		else {
			cerr << "Warning:: Unidentified run parameter in the file: " << field1 << endl;
		}
	}
	fptr.close();

	return true;
}//END readRunfile()

/****************************************************************************
 * checkParams
 * - Throws ConfigError if the parameters cannot describe the microgrid.
 ****************************************************************************/
void checkParams (const SystemParams &sys) {
	if ( sys.timestep <= 0 )
		throw ConfigError("timestep must be positive");
	if ( sys.etaEly <= 0 || sys.etaEly > 1 || sys.etaFc <= 0 || sys.etaFc > 1 || sys.etaDg <= 0 || sys.etaDg > 1 )
		throw ConfigError("efficiencies must lie in (0, 1]");
	if ( sys.importMax < 0 || sys.exportMax < 0 )
		throw ConfigError("grid limits must be non-negative");
	if ( sys.storageCapacity < 0 )
		throw ConfigError("storage capacity must be non-negative");
	if ( sys.elyMin < 0 || sys.elyMin > sys.elyNominal + EPSzero )
		throw ConfigError("electrolyzer minimum power must lie in [0, nominal]");
	if ( sys.fcMin < 0 || sys.fcMin > sys.fcNominal + EPSzero )
		throw ConfigError("fuel-cell minimum power must lie in [0, nominal]");
	if ( sys.dgMin < 0 || sys.dgMin > sys.dgNominal + EPSzero )
		throw ConfigError("diesel minimum power must lie in [0, nominal]");
	if ( sys.curtailPenalty < 0 )
		throw ConfigError("curtailment penalty must be non-negative");
}

void checkParams (const runType &run, const SystemParams &sys) {
	checkParams(sys);

	if ( run.horizon < 1 )
		throw ConfigError("horizon must be at least one step");
	if ( run.startHour < 0 )
		throw ConfigError("start hour must be non-negative");
	if ( run.maxSteps < 0 )
		throw ConfigError("max_steps must be non-negative");
	if ( run.socInit < 0 || run.socInit > sys.storageCapacity + EPSzero )
		throw ConfigError("initial storage level outside [0, capacity]");
	if ( run.backends.empty() )
		throw ConfigError("no MILP backend listed");
	if ( run.solveTimeLimit <= 0 )
		throw ConfigError("solve time limit must be positive");
	if ( run.batchThreads < 1 || run.solverThreads < 1 )
		throw ConfigError("thread counts must be positive");
	for (unsigned int i=0; i<run.loadNominals.size(); i++)
		if ( run.loadNominals[i] <= 0 )
			throw ConfigError("nominal loads must be positive");
}

void printSummary (const runType &run, const SystemParams &sys) {
	cout << "------------------------------------------------------------------" << endl;
	cout << "Horizon          " << setw(6) << run.horizon << " steps of " << sys.timestep << " hr" << endl;
	cout << "Start hour       " << setw(6) << run.startHour << "   (SOC " << run.socInit << " MWh)" << endl;
	if ( run.maxSteps > 0 )
		cout << "Step cap         " << setw(6) << run.maxSteps << endl;
	cout << "Electrolyzer     " << setw(6) << sys.elyNominal << " MW  (min " << sys.elyMin << ", eta " << sys.etaEly << ")" << endl;
	cout << "Fuel cell        " << setw(6) << sys.fcNominal << " MW  (min " << sys.fcMin << ", eta " << sys.etaFc << ")" << endl;
	cout << "Diesel           " << setw(6) << sys.dgNominal << " MW  (min " << sys.dgMin << ", eta " << sys.etaDg << ")" << endl;
	cout << "H2 storage       " << setw(6) << sys.storageCapacity << " MWh" << endl;
	cout << "Grid             " << setw(6) << sys.importMax << " MW import, " << sys.exportMax << " MW export"
		 << (sys.gridExclusive ? " (exclusive)" : "") << endl;
	cout << endl << "Backends         ";
	for (unsigned int i=0; i<run.backends.size(); i++)
		cout << (i ? " > " : "") << run.backends[i];
	cout << endl;
	cout << "Solve time limit = " << run.solveTimeLimit << " s" << endl;
	cout << "------------------------------------------------------------------" << endl;
}
