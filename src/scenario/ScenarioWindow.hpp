//
//  ScenarioWindow.hpp
//  mgmpc
//

#ifndef ScenarioWindow_hpp
#define ScenarioWindow_hpp

#include <vector>

#include "../config.hpp"

using namespace std;

/* Read-only slice of H consecutive hours together with the system parameters used to solve it */
class ScenarioWindow {

public:
	ScenarioWindow (int beginHour, const vector<double> &load, const vector<double> &pv, const vector<double> &wind,
					const vector<double> &importPrice, const vector<double> &exportPrice, const SystemParams &sys);

	int		beginHour () const	{ return begin; }
	int		length () const		{ return (int) load_.size(); }
	double	dt () const			{ return sys_.timestep; }

	double	load (int t) const			{ return load_[t]; }
	double	pv (int t) const			{ return pv_[t]; }
	double	wind (int t) const			{ return wind_[t]; }
	double	importPrice (int t) const	{ return importPrice_[t]; }
	double	exportPrice (int t) const	{ return exportPrice_[t]; }

	const SystemParams& params () const	{ return sys_; }

	double	peakLoad () const;

private:
	int		begin;
	vector<double> load_, pv_, wind_, importPrice_, exportPrice_;
	SystemParams sys_;
};

#endif /* ScenarioWindow_hpp */
