#pragma once

#include <memory>
#include <map>
#include <vector>
#include "Exception.hpp"





/** The long-lived services of a single program run (install paths, loggers, storage, caches).
The services are created in main(), each receiving the collection so that it can look up the others later on.
After all of them are added, start() starts them so that each component's dependencies, declared by
requireForStart() in its constructor, are started before it. stop() then stops them in the reverse order,
giving them a chance to persist their state (such as the CookieCache writing into the Database).

The per-request data (credentials, recipients, the AliasTable) doesn't belong here,
it is passed explicitly to the SendOrchestrator.

Usage:
ComponentCollection cc;
cc.addNew<InstallConfiguration>();
auto cookieCache = cc.addNew<CookieCache>();
...
cc.start();
...
cc.get<Database>()->connection();
...
cc.stop();
*/
class ComponentCollection
{
public:

	/** The kinds of the components; each collection holds at most one component of each kind. */
	enum ComponentKind
	{
		ckInstallConfiguration,  ///< The locations of the config file, logs and data
		ckMultiLogger,           ///< The per-subsystem logger
		ckDatabase,              ///< The SQLite storage for data persisted across runs
		ckCookieCache,           ///< The cache of carrier session cookies, stored in the Database
	};


protected:

	/** The kind-agnostic part of a component, so that all components fit in a single container. */
	class ComponentBase
	{
		friend class ::ComponentCollection;
	public:
		ComponentBase(ComponentKind aKind, ComponentCollection & aComponents):
			mKind(aKind),
			mComponents(aComponents)
		{
		}

		virtual ~ComponentBase() {}

		/** Called by ComponentCollection::start(), after all the required components have been started. */
		virtual void start() = 0;

		/** Called by ComponentCollection::stop(), before any of the required components are stopped.
		The default implementation does nothing. */
		virtual void stop() {}

		/** Declares that aRequiredComponent must be started before (and stopped after) this component.
		Only allowed before the collection is started, throws a LogicError otherwise. */
		inline void requireForStart(ComponentKind aRequiredComponent)
		{
			mComponents.requireForStart(mKind, aRequiredComponent);
		}


	protected:

		ComponentKind mKind;

		/** The collection that this component is a part of. */
		ComponentCollection & mComponents;
	};

	using ComponentBasePtr = std::shared_ptr<ComponentBase>;


public:

	/** The base for all components, binding the component class to its kind. */
	template <ComponentKind tKind>
	class Component:
		public ComponentBase
	{
	public:
		Component(ComponentCollection & aComponents):
			ComponentBase(tKind, aComponents)
		{
		}

		static ComponentKind kind() { return tKind; }
	};



	ComponentCollection();

	/** Stops the components, if not stopped yet. Any exceptions thrown while stopping are logged and dropped. */
	~ComponentCollection();

	/** Adds an already created component.
	Throws a LogicError if a component of the same kind is already present. */
	template <typename ComponentClass>
	void addComponent(std::shared_ptr<ComponentClass> aComponent)
	{
		addComponent(ComponentClass::kind(), aComponent);
	}


	/** Creates a new component, passing this collection and aArgs to its constructor, and adds it.
	Returns the new component.
	Throws a LogicError if a component of the same kind is already present. */
	template <typename ComponentClass, typename... Args>
	std::shared_ptr<ComponentClass> addNew(Args &&... aArgs)
	{
		auto res = std::make_shared<ComponentClass>(*this, std::forward<Args>(aArgs)...);
		addComponent(ComponentClass::kind(), res);
		return res;
	}


	/** Returns the component of the specified class.
	Throws a LogicError if not present. */
	template <typename ComponentClass>
	std::shared_ptr<ComponentClass> get()
	{
		return std::dynamic_pointer_cast<ComponentClass>(get(ComponentClass::kind()));
	}

	/** Returns true if a component of the specified class is present. */
	template <typename ComponentClass>
	bool has() const
	{
		return (mComponents.find(ComponentClass::kind()) != mComponents.end());
	}

	/** Starts all the components, each one after the components it requires.
	Throws a LogicError if a required component is missing or the requirements are cyclic;
	any exception thrown by a component's start() is propagated. */
	void start();

	/** Stops all the started components, in the reverse order of their starting.
	Exceptions thrown by a component's stop() are propagated, the components not yet stopped will be stopped
	by the next stop() call (or the destructor). */
	void stop();

	/** Returns the logger for the specified subsystem, managed by the MultiLogger component. */
	Logger & logger(const QString & aName);

	/** Logs directly to the specified subsystem's logger. */
	template <typename... T>
	void log(const QString & aLoggerName, const QString & aFormatString, const T &... aArgs)
	{
		logger(aLoggerName).log(aFormatString, aArgs...);
	}

	/** Returns the name of the component kind, used in the messages. */
	static QString kindName(ComponentKind aKind);


protected:

	std::map<ComponentKind, ComponentBasePtr> mComponents;

	/** The start dependencies: component kind -> the kinds that must be started before it. */
	std::map<ComponentKind, std::vector<ComponentKind>> mStartRequirements;

	/** The components that have been started and not stopped yet, in their start order. */
	std::vector<ComponentBasePtr> mStarted;

	bool mIsStarted;


	/** Implementation of the templated addComponent(). */
	void addComponent(ComponentKind aKind, ComponentBasePtr aComponent);

	/** Implementation of the templated get(). */
	ComponentBasePtr get(ComponentKind aKind);

	/** Records that aThisComponent requires aRequiredComponent to be started first.
	Throws a LogicError if the collection is already started. */
	void requireForStart(ComponentKind aThisComponent, ComponentKind aRequiredComponent);

	/** Returns all the components ordered so that each one comes after all the components it requires.
	Throws a LogicError if a required component is not present or the requirements form a cycle. */
	std::vector<ComponentBasePtr> componentsInStartOrder();

	/** Appends aKind to aOrder after appending (recursively) all its requirements.
	aVisiting holds the kinds on the current recursion path, for cycle detection. */
	void appendInStartOrder(
		ComponentKind aKind,
		std::vector<ComponentKind> & aVisiting,
		std::vector<ComponentKind> & aOrder
	);
};
